#ifndef N64CORE_CPU_CORE_HPP
#define N64CORE_CPU_CORE_HPP

#include "config.hpp"
#include "pipeline.hpp"
#include "register_file.hpp"
#include <functional>
#include <string>

namespace n64core
{
class Device;

/// trace sink, may be empty
typedef std::function<void(const std::string&)> Logger;

/// R4300i style core: fetch, decode and one pipeline advance per step
class CpuCore
{
public:
	explicit CpuCore(const Config &cfg = Config());

	/// back to the construction time state (unbooted)
	void reset();

	/// run one cycle, fetching through 'mem'
	///@return PC after the cycle
	uint32_t step(Device &mem);

	void setLogger(const Logger &log) { log_ = log; }

	void setBootVector(uint32_t pc) { boot_vector_ = pc; }
	uint32_t bootVector() const { return boot_vector_; }

	uint64_t cycles() const { return cycles_; }
	uint64_t instructionsExecuted() const { return instret_; }
	bool booted() const { return booted_; }
	bool exceptionPending() const { return exception_pending_; }

	RegisterFile& regs() { return regs_; }
	const RegisterFile& regs() const { return regs_; }

	Pipeline& pipeline() { return pipeline_; }
	const Pipeline& pipeline() const { return pipeline_; }

private: // methods
	Instruction fetch(Device &mem);
	void log(const std::string &s) const;

private: // data
	uint32_t reset_vector_;
	uint32_t boot_vector_;
	uint32_t trace_interval_;

	RegisterFile regs_;
	Pipeline pipeline_;
	uint64_t cycles_ = 0;
	uint64_t instret_ = 0;
	bool exception_pending_ = false; ///< reserved, never raised
	bool booted_ = false;
	Logger log_;
};

}

#endif
