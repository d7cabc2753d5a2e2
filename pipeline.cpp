#include "pipeline.hpp"
#include "device.hpp"
#include "register_file.hpp"
#include <stdexcept>

namespace n64core
{
constexpr uint32_t Pipeline::DEFAULT_DEPTH;
constexpr uint64_t Pipeline::NO_PC;

Pipeline::Pipeline(uint32_t depth)
{
	if (depth == 0)
		throw std::invalid_argument("pipeline needs at least one stage");

	stages_.resize(depth);
}

void Pipeline::reset()
{
	for (auto &s : stages_)
		s = Stage();
	stall_ = false;
}

uint64_t Pipeline::advance(const Instruction &inst, RegisterFile &regs, Device &)
{
	if (stall_)
	{
		stall_ = false;
		return NO_PC;
	}

	writeback(regs);

	// shift toward retirement
	for (size_t i = stages_.size() - 1; i > 0; --i)
		stages_[i] = stages_[i - 1];

	stages_[0] = Stage();
	stages_[0].valid = true;
	stages_[0].inst = inst;

	regs.incPc(4);

	// decode + execute in the second stage (the only one when unpipelined)
	const size_t ex = stages_.size() > 1 ? 1 : 0;
	execute(stages_[ex], regs);

	return regs.getPc();
}

void Pipeline::writeback(RegisterFile &regs) const
{
	const Stage &oldest = stages_.back();
	if (!oldest.valid)
		return;

	const uint8_t rd = oldest.inst.rd;
	if (rd != 0)
		regs.setReg(rd, oldest.value);
}

void Pipeline::execute(Stage &s, const RegisterFile &regs) const
{
	if (!s.valid)
		return;

	switch (s.inst.opcode)
	{
	case Op::ADDIU:
		s.value = uint32_t(regs.getReg(s.inst.rs) + s.inst.immediate);
		break;

	default: // no-op, value stays 0
		break;
	}
}

}
