#ifndef N64CORE_REGISTER_FILE_HPP
#define N64CORE_REGISTER_FILE_HPP

#include <cstdint>

namespace n64core
{
/// Coprocessor 0 registers kept by the core
namespace Cr
{
	enum
	{
		STATUS,
		CAUSE,
		EPC,
		BAD_VADDR,
		NUM_CRS
	};
}

/// Architected register state of the R4300i
/// All integer values are held modulo 2^32.
class RegisterFile
{
public:
	static constexpr uint32_t NUM_REGS = 32;
	static constexpr uint32_t DEFAULT_PC = 0xbfc00000; ///< PIF ROM reset vector
	static constexpr uint32_t DEFAULT_STATUS = 0x34000000;

	explicit RegisterFile(uint32_t reset_pc = DEFAULT_PC);

	uint32_t getReg(uint32_t num) const { return gpr_[num]; }

	/// r0 is not forced to zero
	void setReg(uint32_t num, uint64_t val) { gpr_[num] = uint32_t(val); }

	double getFloat(uint32_t num) const { return fpr_[num]; }
	void   setFloat(uint32_t num, double val) { fpr_[num] = val; }

	uint32_t getCr(uint32_t num) const;
	void     setCr(uint32_t num, uint64_t val);

	uint32_t getHi() const { return hi_; }
	uint32_t getLo() const { return lo_; }
	void setHi(uint64_t val) { hi_ = uint32_t(val); }
	void setLo(uint64_t val) { lo_ = uint32_t(val); }

	uint32_t getPc() const { return pc_; }
	void setPc(uint64_t pc) { pc_ = uint32_t(pc); }

	/// update PC
	void incPc(int64_t delta = 4) { pc_ = uint32_t(pc_ + delta); }

private: // data
	uint32_t pc_;
	uint32_t gpr_[NUM_REGS] = {0,};
	double   fpr_[NUM_REGS] = {0,};
	uint32_t hi_ = 0;
	uint32_t lo_ = 0;
	uint32_t cr_[Cr::NUM_CRS] = {DEFAULT_STATUS, 0, 0, 0};
};

}

#endif
