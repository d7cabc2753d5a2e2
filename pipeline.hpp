#ifndef N64CORE_PIPELINE_HPP
#define N64CORE_PIPELINE_HPP

#include "inst.hpp"
#include <cstdint>
#include <vector>

namespace n64core
{
class Device;
class RegisterFile;

/// Fixed depth shift register of in-flight instructions
///
/// Stage 0 holds the newest instruction, stage depth-1 the oldest. Each
/// non-stalled advance retires the oldest stage into the register file,
/// shifts, and executes the second stage. There is no forwarding and no
/// hazard detection; stalls are requested by the caller.
class Pipeline
{
public:
	static constexpr uint32_t DEFAULT_DEPTH = 5;

	/// returned by advance() when the cycle was stalled
	static constexpr uint64_t NO_PC = ~uint64_t(0);

	struct Stage
	{
		bool valid = false; ///< holds an instruction
		Instruction inst;
		uint32_t value = 0; ///< result waiting for writeback
	};

	explicit Pipeline(uint32_t depth = DEFAULT_DEPTH);

	uint32_t depth() const { return static_cast<uint32_t>(stages_.size()); }

	const Stage& stage(uint32_t i) const { return stages_[i]; }

	/// freeze the next advance
	void setStall(bool b = true) { stall_ = b; }
	bool stalled() const { return stall_; }

	/// empty every stage and drop a pending stall
	void reset();

	/// run one cycle with 'inst' entering stage 0
	///@return the new PC, or NO_PC when the cycle was stalled
	uint64_t advance(const Instruction &inst, RegisterFile &regs, Device &mem);

private: // methods
	void writeback(RegisterFile &regs) const;
	void execute(Stage &s, const RegisterFile &regs) const;

private: // data
	std::vector<Stage> stages_;
	bool stall_ = false;
};

}

#endif
