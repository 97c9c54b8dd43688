/*
 * app_handshake.hpp
 *
 *  Created on: Oct 24, 2025
 *
 *  Requesting side of the four-phase start/done handshake every sub-routine call goes through
 *  	1) requester raises start
 *  	2) callee finishes, raises done and holds it
 *  	3) requester sees done, drops start
 *  	4) callee sees start low, drops done --> call complete
 *
 *  Usage: `begin()` on entry to the calling state, then every edge `step()` with the callee's done
 *  and publish `start()` as the request line. Leave the state once `complete()`.
 */

#pragma once

#include "app_proctypes.hpp"

class Handshake_Master {
public:
	enum class Phase : uint8_t {
		IDLE,			//nothing going on
		WAIT_CLEAR,		//callee still holds done from somewhere else, hold off the request
		REQUESTING,		//start high, waiting for done
		RELEASING,		//start low, waiting for done to drop
		COMPLETE,
	};

	//kick off a call; pass the callee's done line as it is right now
	//a callee already reporting done is a protocol violation, remembered in `stale_done()`
	void begin(bool done_now) {
		stale = done_now;
		phase = done_now ? Phase::WAIT_CLEAR : Phase::REQUESTING;
	}

	//advance with the callee's done line for this edge
	void step(bool done) {
		switch(phase) {
		case Phase::WAIT_CLEAR:
			if(!done) phase = Phase::REQUESTING;
			break;
		case Phase::REQUESTING:
			if(done) phase = Phase::RELEASING;
			break;
		case Phase::RELEASING:
			if(!done) phase = Phase::COMPLETE;
			break;
		default:
			break;
		}
	}

	void reset() { phase = Phase::IDLE; stale = false; }

	//request line to publish
	bool start() const { return phase == Phase::REQUESTING; }

	bool complete() const { return phase == Phase::COMPLETE; }
	bool stale_done() const { return stale; }
	Phase current() const { return phase; }

private:
	Phase phase = Phase::IDLE;
	bool stale = false;
};
