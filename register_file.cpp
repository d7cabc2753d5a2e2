#include "register_file.hpp"

namespace n64core
{
constexpr uint32_t RegisterFile::NUM_REGS;
constexpr uint32_t RegisterFile::DEFAULT_PC;
constexpr uint32_t RegisterFile::DEFAULT_STATUS;

RegisterFile::RegisterFile(uint32_t reset_pc)
: pc_(reset_pc)
{
}

uint32_t RegisterFile::getCr(uint32_t num) const
{
	if (num >= Cr::NUM_CRS)
		return 0;

	return cr_[num];
}

void RegisterFile::setCr(uint32_t num, uint64_t val)
{
	if (num >= Cr::NUM_CRS)
		return; // unimplemented register, writes ignored

	cr_[num] = uint32_t(val);
}

}
