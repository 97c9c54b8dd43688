/*
 * app_utils.hpp
 *
 *  Created on: Oct 20, 2025
 */

#pragma once

#include <span>
#include <array>
#include <string>
#include <cstring> //for memcpy
#include <algorithm> //for std::min
#include <type_traits> //for callback function macros

#include "app_proctypes.hpp"

//============================ CLAMPING/ROUNDING HELPERS =========================

template<typename T>
constexpr T clip(T input, T in_min, T in_max) {
	if(input < in_min) return in_min;
	if(input > in_max) return in_max;
	return input;
}

//integer division that rounds up, i.e. how many words do we need to hold `num` bits
template<typename T>
constexpr T div_roundup(T num, T den) {
	return (num + den - 1) / den;
}

//smallest power of two that's greater or equal to the input
//memory partitions get sized like this so device addressing is just a shift
constexpr size_t next_pow2(size_t v) {
	size_t p = 1;
	while(p < v) p <<= 1;
	return p;
}

//byte swap a 32-bit word
constexpr uint32_t swap_endian_32(uint32_t v) {
	return	((v & 0x0000'00FF) << 24) |
			((v & 0x0000'FF00) << 8)  |
			((v & 0x00FF'0000) >> 8)  |
			((v & 0xFF00'0000) >> 24);
}

//=========================== CALLBACK FUNCTION HELPERS ========================

/*
 * Callback function "typedefs" essentially
 * It's surprisingly difficult to *cleanly* call `void()` member functions of classes
 * while also keeping overhead low (i.e. avoiding std::function and its potential heap usage)
 *
 * `Callback Function` supports:
 * 		- attachment of a global, "c-style" function
 * 		- attachment of a static member function of a class
 * 		- attachment of non-capturing lambda functions
 * 		- attachment of a member function of a class instance [NOTE THIS IS NOT PERFORMED SUPER SAFELY, NECESSARY EVIL FOR TYPE ERASURE]
 * 		- Default constructor is "safe" i.e. calling an uninitialized `Callback Function` will do nothing rather than seg fault
 * 		- call the callback using the standard `()` operator syntax
 * 		- no heap usage, no need for persistent storage (other than the functions themselves)
 * 			- copy, move, destruction all fair game
 *
 * Capturing lambdas aren't supported--the lambda closure would go out of scope at the end of the function that created it
 * and we'd be holding a reference to garbage. If you need state, bind a member function of an instance instead.
 */

//aliases to make code a bit more readable
using Instance_Storage_t = void*; //allow the instance to have its members modified in downstream calls
template<typename R = void>
using Function_t = R(*)(); //redirect to a function returning R
template<typename R = void>
using Forward_Function_t = R(*)(Instance_Storage_t); //Callbacks will store a forward function

template<typename R = void>
class Callback_Function {
public:
	//============== EMPTY CALLBACKS FOR DEFAULT INITIALIZATION ==============
	static constexpr R empty_func() { return R(); } //upon default initialization, just point to this empty function; returns default initialized return type
	static constexpr R empty_ffunc(Instance_Storage_t) { return R(); } //point the empty forwarding function to this; returns default initialized return type

	//=============== CONSTRUCTORS =============
	constexpr Callback_Function()
		: instance(nullptr), func(empty_func), forward_func(empty_ffunc) {} //default initializer

	Callback_Function(Function_t<R> _func)
		: instance(nullptr), func(_func), forward_func(empty_ffunc) {} //use this for global/static/non-capturing lambda execution

	template <typename F, typename = std::enable_if_t<std::is_convertible_v<F, Function_t<R>>>>
	Callback_Function(F f)
		: instance(nullptr), func(static_cast<Function_t<R>>(f)), forward_func(empty_ffunc) {} //for non-capturing lambdas

	Callback_Function(Instance_Storage_t _instance, Forward_Function_t<R> _forward_func)
		: instance(_instance), func(empty_func), forward_func(_forward_func) {} //for passing an instance function

	//=============== CALL OPERATOR =============
	R operator()() const {
		if(instance == nullptr) return func();
		else return forward_func(instance);
	}

private:
	Instance_Storage_t instance; //holds a pointer to the instance we'd like to redirect to
	Function_t<R> func; //call this if we're executing a global function or lambda with empty capture
	Forward_Function_t<R> forward_func; //call this when we're executing on an instance
};

template <typename T, typename R, R(T::*instance_func)()>
class Instance_Callback_Function {
public:
	//========== FORWARDING FUNCTION ============
	static inline constexpr R forward_func_template(Instance_Storage_t _instance) {
		auto instance = reinterpret_cast<T*>(_instance);
		return (instance->*instance_func)();
	}

	//========= CONSTRUCTORS ===========
	Instance_Callback_Function(): instance(nullptr) {} //default constructor, should never be used
	Instance_Callback_Function(T* _instance): instance(_instance) {} //constructor that takes an actual instance

	//========= CAST OPERATOR OVERRIDE =========
	explicit operator Callback_Function<R>() const {
		if(instance)
			return Callback_Function<R>(reinterpret_cast<Instance_Storage_t>(instance), forward_func_template);
		else
			return Callback_Function<R>();
	}

private:
	T* instance; //holds a pointer to the instance we'd like to redirect to
};

//###### macro functions to make callback binding easier #########
//deduce the return type R from the member function pointer type
#define MAKE_CALLBACK(instance, method) \
    Instance_Callback_Function< \
        std::remove_pointer_t<decltype(instance)>, \
        std::invoke_result_t<decltype(&std::remove_pointer_t<decltype(instance)>::method), std::remove_pointer_t<decltype(instance)>*>, \
        &std::remove_pointer_t<decltype(instance)>::method \
    >(instance)

#define BIND_CALLBACK(instance, method) \
    static_cast<Callback_Function< \
        std::invoke_result_t<decltype(&std::remove_pointer_t<decltype(instance)>::method), std::remove_pointer_t<decltype(instance)>* > \
    >>(MAKE_CALLBACK(instance, method))

//###### persistent (intentionally leaked) members #######
//for types that can only be built through their `mk()` factory (signals, pub vars)
//usage: PERSISTENT((Pub_Var<bool>), my_flag, true);
//parentheses around the type let templates with commas through the preprocessor
#define PERSISTENT_UNWRAP(...) __VA_ARGS__
#define PERSISTENT(type, name, ...) \
	PERSISTENT_UNWRAP type& name = PERSISTENT_UNWRAP type::mk(__VA_ARGS__)

//============================================== ARRAY TO SPAN SLICING AND CONVERSION UTILTIES ===============================================

//view a section [begin, end) of an array
//ASSUMES INDICES ARE VALID
template <typename T, size_t len>
inline std::span<T> section(std::array<T, len>& arr, size_t begin, size_t end) {
    return std::span<T>(arr.data() + begin, end - begin);
}

template <typename T, size_t len>
inline std::span<const T> section(const std::array<T, len>& arr, size_t begin, size_t end) {
    return std::span<const T>(arr.data() + begin, end - begin);
}
