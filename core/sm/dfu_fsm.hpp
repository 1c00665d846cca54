#pragma once

#include "tinyfsm.hpp"
#include "error.hpp"
#include "dfu_state.hpp"

class DFUSession;

struct DFUStepEvent : tinyfsm::Event {};
struct DFUCancelEvent : tinyfsm::Event {};

// One step of the update per DFUStepEvent; every step either moves to the next
// state or records the ErrorCode and moves to FailedState
class DFUStateMachine : public tinyfsm::Fsm<DFUStateMachine>
{
protected:
	template<typename S, typename F>
	void attempt(F step) {
		try {
			step();
		} catch (ErrorCode e) {
			fail(e);
			return;
		}
		transit<S>();
	}
	void fail(ErrorCode e);

public:
	static inline DFUSession *session = nullptr;

	void react(tinyfsm::Event const &) {}
	virtual void react(DFUStepEvent const &) {}
	virtual void react(DFUCancelEvent const &);
	virtual void entry(void);
	virtual void exit(void) {}
	virtual DFUStateId id() const = 0;

	static bool is_finished();
};

class IdleState : public DFUStateMachine
{
public:
	void react(DFUStepEvent const &) override;
	DFUStateId id() const override { return DFUStateId::IDLE; }
};

class AppConnectedState : public DFUStateMachine
{
public:
	void react(DFUStepEvent const &) override;
	DFUStateId id() const override { return DFUStateId::APP_CONNECTED; }
};

class BootloaderJumpSentState : public DFUStateMachine
{
public:
	void react(DFUStepEvent const &) override;
	DFUStateId id() const override { return DFUStateId::BOOTLOADER_JUMP_SENT; }
};

class WaitingRebootState : public DFUStateMachine
{
public:
	void react(DFUStepEvent const &) override;
	DFUStateId id() const override { return DFUStateId::WAITING_REBOOT; }
};

class BootloaderConnectedState : public DFUStateMachine
{
public:
	void react(DFUStepEvent const &) override;
	DFUStateId id() const override { return DFUStateId::BOOTLOADER_CONNECTED; }
};

class DfuStartedState : public DFUStateMachine
{
public:
	void react(DFUStepEvent const &) override;
	DFUStateId id() const override { return DFUStateId::DFU_STARTED; }
};

class SizeSentState : public DFUStateMachine
{
public:
	void react(DFUStepEvent const &) override;
	DFUStateId id() const override { return DFUStateId::SIZE_SENT; }
};

class InitSentState : public DFUStateMachine
{
public:
	void react(DFUStepEvent const &) override;
	DFUStateId id() const override { return DFUStateId::INIT_SENT; }
};

class ImageStreamingState : public DFUStateMachine
{
public:
	void react(DFUStepEvent const &) override;
	DFUStateId id() const override { return DFUStateId::IMAGE_STREAMING; }
};

class ImageCompleteState : public DFUStateMachine
{
public:
	void react(DFUStepEvent const &) override;
	DFUStateId id() const override { return DFUStateId::IMAGE_COMPLETE; }
};

class ValidatedState : public DFUStateMachine
{
public:
	void react(DFUStepEvent const &) override;
	DFUStateId id() const override { return DFUStateId::VALIDATED; }
};

class ActivatedState : public DFUStateMachine
{
public:
	void react(DFUCancelEvent const &) override {}
	void entry() override;
	DFUStateId id() const override { return DFUStateId::ACTIVATED; }
};

class FailedState : public DFUStateMachine
{
public:
	void react(DFUCancelEvent const &) override {}
	DFUStateId id() const override { return DFUStateId::FAILED; }
};
