/*
 * app_stdio_stream.cpp
 *
 *  Created on: Nov 3, 2025
 */

#include <poll.h>
#include <unistd.h>
#include <cerrno>

#include "app_stdio_stream.hpp"
#include "app_debug_if.hpp"

Stdio_Stream::Stdio_Stream(int _fd_in, int _fd_out):
	fd_in(_fd_in), fd_out(_fd_out)
{}

void Stdio_Stream::fill() {
	if(input_closed) return;

	//zero timeout, just ask
	pollfd pfd = {fd_in, POLLIN, 0};
	int ready = poll(&pfd, 1, 0);
	if(ready <= 0) return;
	if(!(pfd.revents & (POLLIN | POLLHUP))) return;

	std::array<uint8_t, READ_CHUNK> chunk = {};
	ssize_t n = read(fd_in, chunk.data(), chunk.size());
	if(n == 0) {
		input_closed = true;
		return;
	}
	if(n < 0) {
		if(errno != EAGAIN && errno != EINTR) {
			Debug::WARN("Stdio_Stream: read failed, errno " + std::to_string(errno));
			input_closed = true;
		}
		return;
	}
	pending.insert(pending.end(), chunk.begin(), chunk.begin() + n);
}

size_t Stdio_Stream::rx_bytes_available() {
	fill();
	return pending.size();
}

size_t Stdio_Stream::rx_bytes_read(std::span<uint8_t, std::dynamic_extent> dest) {
	size_t n = std::min(dest.size(), pending.size());
	std::copy(pending.begin(), pending.begin() + n, dest.begin());
	pending.erase(pending.begin(), pending.begin() + n);
	return n;
}

//writes go out whole; a short write just gets retried
size_t Stdio_Stream::tx_bytes_write(std::span<const uint8_t, std::dynamic_extent> src) {
	size_t written = 0;
	while(written < src.size()) {
		ssize_t n = write(fd_out, src.data() + written, src.size() - written);
		if(n < 0) {
			if(errno == EINTR) continue;
			//no Debug here, it may be routed through this stream
			return written;
		}
		written += static_cast<size_t>(n);
	}
	return written;
}
