/*
 * app_vector.hpp
 *
 *  Created on: Oct 22, 2025
 *
 * Fixed-capacity stand-in for a std::vector
 * Storage is reserved up front; elements are constructed as they get pushed
 * Capacity and type are template parameters
 */

#pragma once

#include <memory>	//construct_at, destroy_at
#include <new>		//launder

#include "app_proctypes.hpp"
#include "app_utils.hpp"
#include "app_debug_if.hpp"

template<typename T, size_t MAX_N>
class App_Vector {

	static_assert(std::is_move_constructible_v<T>, "App_Vector<T> requires move-constructible T");

public:
	//========================== CONSTRUCTORS/DESTRUCTORS ============================
	// No elements constructed initially
	constexpr App_Vector() noexcept : last_elem(0) {}

	//copy constructor
	App_Vector(const App_Vector& other) : last_elem(0) {
		for (size_t i = 0; i < other.size(); i++) std::construct_at(ptr(i), other[i]);
		last_elem = other.size();
	}

	//copy assignment, destroy what we had first
	App_Vector& operator=(const App_Vector& other) {
		if (this == &other) return *this;
		clear();
		for (size_t i = 0; i < other.size(); i++) std::construct_at(ptr(i), other[i]);
		last_elem = other.size();
		return *this;
	}

	//explicit destructor to call object destructors
	~App_Vector() { clear(); }

	//==================== CAPACITY/SIZE ======================
	constexpr size_t capacity() const { return MAX_N; }
	size_t size() const { return last_elem; }
	bool empty() const { return last_elem == 0; }

	//========================== ELEMENT ACCESS ==========================
	T& operator[](size_t i) { return *ptr(i); }
	const T& operator[](size_t i) const { return *ptr(i); }

	T* data() { return ptr(0); }
	const T* data() const { return ptr(0); }

	//=========================== ITERATORS ==================================
	T* begin() { return data(); }
	T* end() { return data() + last_elem; }
	const T* begin() const { return data(); }
	const T* end() const { return data() + last_elem; }

	//============================ PUSH BACK ===============================
	//add new element at end
	//returns false on overflow rather than crashing
	bool push_back(const T& value) {
		if (last_elem >= MAX_N) { Debug::ERROR("App_Vector: push_back overflow"); return false; }
		std::construct_at(ptr(last_elem), value);
		last_elem++;
		return true;
	}

	//destruct all objects
	void clear() noexcept {
		for (size_t i = 0; i < last_elem; i++) std::destroy_at(ptr(i));
		last_elem = 0;
	}

private:
	//raw aligned space rather than an array of objects
	//means we don't have to construct all objects at instantiation
	using Storage = std::aligned_storage_t<sizeof(T), alignof(T)>;
	Storage storage[MAX_N];
	size_t last_elem;

	//storage is just bytes, so every access goes through launder
	T* ptr(size_t i) { return std::launder(reinterpret_cast<T*>(&storage[i])); }
	const T* ptr(size_t i) const { return std::launder(reinterpret_cast<const T*>(&storage[i])); }
};
