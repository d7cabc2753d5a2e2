#include "cpu_core.hpp"
#include "device.hpp"
#include "rdram.hpp"
#include <iomanip>
#include <sstream>

namespace n64core
{
CpuCore::CpuCore(const Config &cfg)
: reset_vector_(cfg.reset_vector)
, boot_vector_(cfg.boot_vector)
, trace_interval_(cfg.trace_interval)
, regs_(cfg.reset_vector)
, pipeline_(cfg.pipeline_depth)
{
}

void CpuCore::reset()
{
	regs_ = RegisterFile(reset_vector_);
	pipeline_.reset();
	cycles_ = 0;
	instret_ = 0;
	exception_pending_ = false;
	booted_ = false;
	log("[R4300i] CPU Core Reset to PIF Boot");
}

uint32_t CpuCore::step(Device &mem)
{
	++cycles_;
	++instret_;

	Instruction inst;
	if (!booted_)
	{
		// PIF hand off, the first cycle only fetches a NOP
		regs_.setPc(boot_vector_);
		booted_ = true;

		std::ostringstream os;
		os << "[R4300i] Booted to 0x" << std::hex << std::uppercase
		    << std::setw(8) << std::setfill('0') << boot_vector_;
		log(os.str());
	}
	else
	{
		inst = fetch(mem);
	}

	const uint64_t new_pc = pipeline_.advance(inst, regs_, mem);

	if (trace_interval_ != 0 && cycles_ % trace_interval_ == 0)
	{
		std::ostringstream os;
		os << "[R4300i] Cycle " << std::setw(8) << std::setfill('0') << cycles_
		    << " | PC=0x" << std::hex << std::uppercase << std::setw(8) << regs_.getPc();
		log(os.str());
	}

	if (new_pc == Pipeline::NO_PC)
		return regs_.getPc();

	return uint32_t(new_pc);
}

Instruction CpuCore::fetch(Device &mem)
{
	// PC already points one word past the instruction entering the pipe
	const uint32_t addr = (regs_.getPc() - 4) & Rdram::SEGMENT_MASK;
	return Instruction::decode(mem.read32(addr));
}

void CpuCore::log(const std::string &s) const
{
	if (log_)
		log_(s);
}

}
