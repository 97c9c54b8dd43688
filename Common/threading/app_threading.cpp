/*
 * app_threading.cpp
 *
 *  Created on: Oct 22, 2025
 */

#include "app_threading.hpp"

//==================================================== MUTEX CLASS ======================================================

//release the mutex
void Mutex::UNLOCK() {
	mutex_claimed.clear(std::memory_order_release);
}

//check to see if the mutex is free, claim if it is
bool Mutex::TRY_LOCK() {
	//a neat trick to maintain locked state if mutex is locked
	//but also claim the mutex if unlocked
	//acquire ordering so whatever the last owner wrote is visible to us
	return !mutex_claimed.test_and_set(std::memory_order_acquire);
}


//==================================================== THREAD SIGNALING CLASS ======================================================

//#### LEAD THREAD ####
//constructor just initializes atomic epoch to 0
Thread_Signal::Thread_Signal(): epoch(0) {}

//leading thread signals all listening threads
void Thread_Signal::signal() {
	//atomically increment the epoch
	//rollover only matters if a listener misses exactly 2^32 signals
	epoch++;
}

//listen to this thread with a thread signal listener
Thread_Signal_Listener Thread_Signal::listen() { return Thread_Signal_Listener(this); }

//get the current epoch (read using overloaded atomic guards)
uint32_t Thread_Signal::get_epoch() const { return epoch.read(); }

//#### LISTENER ####
Thread_Signal_Listener::Thread_Signal_Listener(Thread_Signal* signal): signal_to_monitor(signal)
{
	//refresh the current epoch upon construction
	refresh();
}

//refresh just pulls the current epoch from the parent
//has an affect of "getting the listener up to speed"
void Thread_Signal_Listener::refresh() {
	if(signal_to_monitor) {
		local_epoch = signal_to_monitor->get_epoch();
	}
}

//non blocking function that checks if state has been updated since last refresh
bool Thread_Signal_Listener::check(bool do_refresh) {
	//early exit if our parent signal isn't valid
	if(signal_to_monitor == nullptr) return false;

	//check if our epochs differ --> implies a change has happened
	uint32_t current_epoch = signal_to_monitor->get_epoch();
	bool update_happened = local_epoch != current_epoch;

	//update the local epoch if we want
	if(do_refresh) local_epoch = current_epoch;

	//and finally return whether an update happened
	return update_happened;
}

