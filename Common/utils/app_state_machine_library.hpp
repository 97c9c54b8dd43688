/*
 * app_state_machine_library.hpp
 *
 *  Created on: Oct 20, 2025
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_utils.hpp"

/*
 * ESM system - "Extended State Machine" base class
 *
 * Every controller FSM (interpreter, MCC, TSA, data mover, pattern modifier, rate monitor, config writer)
 * gets built out of these. Each one is stepped exactly once per edge of the clock domain it lives in.
 * 	- states are nodes of a graph
 * 	- transitions are directed edges of a graph, each with a callback that reports whether to take it
 * 	- on top of the canonical state machine, every state can run:
 * 		- `impl_on_state_entry` on the first edge spent in the state (arm timers, publish requests)
 * 		- `impl_state_execution` on every edge spent in the state (count beats, shift bits)
 * 		- `impl_on_state_exit` on the edge we leave the state (retract requests, latch results)
 *
 * Usage Details:
 * 		1) Write member functions for entry/execution/exit and for each transition check
 * 		2) Instantiate ALL your ESM_State members; construct by passing the bound callbacks and a name for traces
 * 		3) BELOW THESE, create an array of ESM_Transition for each state
 * 			- pass the next state and the condition for the state transition in the constructor
 * 		4) In the constructor body, call `attach_state_transitions()` on each of the states
 *		5) BELOW THESE, instantiate an Extended_State_Machine with the entry state
 *		6) On every clock edge of the owning domain call `RUN_ESM()`
 *
 * Timing to keep in mind:
 * 		- entry and execution of a state run on the SAME edge
 * 		- transitions are assessed at the end of an edge; the next state's entry runs on the NEXT edge
 * 		  so a state with an unconditional transition costs exactly one edge
 */

//forward declaring some classes up front:
class ESM_State; //state class
class ESM_Transition; //transition class (for transitions between states)
class Extended_State_Machine; //container class that runs the state machine

//================================================= CLASS FOR INDIVIDUAL STATE IN STATE MACHINE =================================================

class ESM_State {
public:
	//only the state machine container gets to execute states
	friend class Extended_State_Machine;

	//constructor takes callback function arguments
	//name only shows up in transition traces
	ESM_State(	Callback_Function<> _impl_state_on_entry,
				Callback_Function<> _impl_state_execution,
				Callback_Function<> _impl_state_on_exit,
				const char* _name = "");

	//attach a list of transitions out of this state
	//checked in order; first one that reports true wins
	void attach_state_transitions(std::span<ESM_Transition, std::dynamic_extent> _transition_list);

	//name of the state, for traces
	const char* name() const { return state_name; }

protected:
	/*
	 * Runs the state for one clock edge
	 * 	- runs `impl_on_state_entry` if we just entered the state
	 *  - runs `impl_state_execution`
	 *  - checks the transition list; on the first valid transition runs `impl_on_state_exit` and
	 *    flags the state as freshly entered for next time
	 * - returns the state to run on the next edge
	 */
	ESM_State* EXECUTE_STATE();

	//forget that we've been running; next execution runs the entry hook again
	//does NOT run the exit hook
	void RESET_STATE();

private:
	//flag that says whether we just entered a particular state
	//controls the execution of `impl_on_state_entry()`
	bool just_entered_state = true;

	//callback functions to execute state entry/exit/loop functions
	Callback_Function<> impl_state_on_entry;
	Callback_Function<> impl_state_execution;
	Callback_Function<>	impl_state_on_exit;

	//view into the transitions out of this state
	std::span<ESM_Transition, std::dynamic_extent> state_transitions;

	const char* state_name;
};

//================================================= CLASS FOR INDIVIDUAL STATE TRANSITION IN STATE MACHINE =================================================
class ESM_Transition {
public:
	//pass in the next state and a callback that reports whether we should go there
	ESM_Transition(ESM_State* _next_state, Callback_Function<bool> _assess_report_state_transition);

	//run the transition check
	//returns the next state pointer if we should transition, nullptr otherwise
	ESM_State* operator()() const;

private:
	ESM_State* const next_state;
	Callback_Function<bool> const assess_report_state_transition;
};

//================================================= CONTAINER THAT RUNS THE STATE MACHINE =================================================

class Extended_State_Machine {
public:
	//pass the entry point of the state machine
	//machine name prefixes the transition traces
	Extended_State_Machine(ESM_State* entry_state, const char* _machine_name = "");

	//run one clock edge worth of the state machine
	void RUN_ESM();

	//synchronous reset: return to the entry state as if we just started executing
	void RESET_ESM();

	//handy for status reporting and tests
	const ESM_State* current() const { return current_state; }
	bool in(const ESM_State& state) const { return current_state == &state; }

private:
	//state that runs on the next edge
	ESM_State* current_state;

	//remember the entry state for when we reset the state machines
	ESM_State* entry_state;

	const char* machine_name;
};
