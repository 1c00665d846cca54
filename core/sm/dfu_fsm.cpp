#include "dfu_fsm.hpp"
#include "dfu_session.hpp"
#include "debug.hpp"

// FSM initial state -> IdleState
FSM_INITIAL_STATE(DFUStateMachine, IdleState)

void DFUStateMachine::entry(void) {
	DEBUG_TRACE("entry: %s", dfu_state_str(id()));
	session->enter_state(id());
}

void DFUStateMachine::fail(ErrorCode e) {
	session->record_failure(id(), e);
	transit<FailedState>();
}

void DFUStateMachine::react(DFUCancelEvent const &) {
	fail(ErrorCode::DFU_CANCELLED);
}

bool DFUStateMachine::is_finished() {
	return is_in_state<ActivatedState>() || is_in_state<FailedState>();
}

void IdleState::react(DFUStepEvent const &) {
	attempt<AppConnectedState>([]() { session->connect_application(); });
}

void AppConnectedState::react(DFUStepEvent const &) {
	attempt<BootloaderJumpSentState>([]() { session->enter_bootloader(); });
}

void BootloaderJumpSentState::react(DFUStepEvent const &) {
	attempt<WaitingRebootState>([]() { session->await_reboot(); });
}

void WaitingRebootState::react(DFUStepEvent const &) {
	attempt<BootloaderConnectedState>([]() { session->connect_bootloader(); });
}

void BootloaderConnectedState::react(DFUStepEvent const &) {
	attempt<DfuStartedState>([]() { session->engine().start_dfu(session->connection()); });
}

void DfuStartedState::react(DFUStepEvent const &) {
	attempt<SizeSentState>([]() { session->engine().send_image_sizes(session->connection(), session->package()); });
}

void SizeSentState::react(DFUStepEvent const &) {
	attempt<InitSentState>([]() { session->engine().send_init_packet(session->connection(), session->package()); });
}

void InitSentState::react(DFUStepEvent const &) {
	attempt<ImageStreamingState>([]() { session->engine().start_image_transfer(session->connection()); });
}

void ImageStreamingState::react(DFUStepEvent const &) {
	attempt<ImageCompleteState>([]() {
		session->engine().stream_image(session->connection(), session->package());
		session->engine().await_image_complete();
	});
}

void ImageCompleteState::react(DFUStepEvent const &) {
	attempt<ValidatedState>([]() { session->engine().validate(session->connection()); });
}

void ValidatedState::react(DFUStepEvent const &) {
	attempt<ActivatedState>([]() {
		session->engine().activate(session->connection());
		session->release_connection();
	});
}

void ActivatedState::entry() {
	DFUStateMachine::entry();
	session->record_success();
}
