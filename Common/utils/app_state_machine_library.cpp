/*
 * app_state_machine_library.cpp
 *
 *  Created on: Oct 20, 2025
 */

#include "app_state_machine_library.hpp"
#include "app_debug_if.hpp"	//transition traces

//================================================= MEMBER FUNCTIONS FOR ESM_STATE =================================================
//nothing exciting going on in the constructor
//just copying over the callback functions
ESM_State::ESM_State(	Callback_Function<> _impl_state_on_entry,
						Callback_Function<> _impl_state_execution,
						Callback_Function<> _impl_state_on_exit,
						const char* _name):
	impl_state_on_entry(_impl_state_on_entry),
	impl_state_execution(_impl_state_execution),
	impl_state_on_exit(_impl_state_on_exit),
	state_transitions(),
	state_name(_name)
{}

void ESM_State::attach_state_transitions(std::span<ESM_Transition, std::dynamic_extent> _transition_list) {
    //just save the list of transitions
    state_transitions = _transition_list;
}

ESM_State* ESM_State::EXECUTE_STATE() {
    //first edge in this state runs the entry hook
    if(just_entered_state) {
        impl_state_on_entry();
        just_entered_state = false;
    }

    //body of the state runs every edge
    impl_state_execution();

    //then check the transition list
    //first valid transition wins; run the exit hook and re-arm the entry hook for next time
    for(const auto& transition : state_transitions) {
        ESM_State* next_state = transition();
        if(next_state) {
        	impl_state_on_exit();
            just_entered_state = true;
            return next_state;
        }
    }

    //no transition, stick around
    return this;
}

//reset just re-arms the entry hook
//but DON'T call `on_state_exit()`--haven't actually transitioned out of the state
void ESM_State::RESET_STATE() {
	just_entered_state = true;
}

//================================================= MEMBER FUNCTIONS FOR ESM_TRANSITION =================================================
ESM_Transition::ESM_Transition(ESM_State* _next_state, Callback_Function<bool> _assess_report_state_transition)
	: next_state(_next_state), assess_report_state_transition(_assess_report_state_transition) {}

ESM_State* ESM_Transition::operator()() const {
	return assess_report_state_transition() ? next_state : nullptr;
}

//================================================= CONTAINER THAT RUNS THE STATE MACHINE =================================================
Extended_State_Machine::Extended_State_Machine(ESM_State* _entry_state, const char* _machine_name)
    : current_state(_entry_state), entry_state(_entry_state), machine_name(_machine_name) {}

void Extended_State_Machine::RUN_ESM() {
    //execute the current state
    //and update the state pointer if we transition states
    ESM_State* next_state = current_state->EXECUTE_STATE();

    //trace state changes at the most verbose debug level only
    if(next_state != current_state && Debug::tracing()) {
    	Debug::TRACE(std::string(machine_name) + ": " + current_state->name() + " -> " + next_state->name());
    }
    current_state = next_state;
}

void Extended_State_Machine::RESET_ESM() {
	//reset the state that we're currently executing
	//and return back to our entry state
	current_state->RESET_STATE();
	current_state = entry_state;
	current_state->RESET_STATE();
}
