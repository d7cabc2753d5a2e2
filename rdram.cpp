#include "rdram.hpp"
#include <algorithm>
#include <stdexcept>

namespace n64core
{
constexpr uint32_t Rdram::SEGMENT_MASK;
constexpr uint32_t Rdram::MAX_SIZE_MB;

Rdram::Rdram(uint32_t size_mb)
{
	if (size_mb == 0)
		throw std::invalid_argument("RDRAM size must be at least 1 MB");
	if (size_mb > MAX_SIZE_MB)
		throw std::invalid_argument("RDRAM size exceeds the physical segment");

	ram_.resize(size_t(size_mb) * 1024 * 1024, 0);
}

RomInfo Rdram::loadRom(const std::vector<uint8_t> &data)
{
	rom_ = data;

	const size_t sz = ram_.size();
	for (size_t i = 0; i < data.size(); ++i)
		ram_[i % sz] = data[i];

	return RomInfo::parse(data);
}

void Rdram::clear()
{
	std::fill(ram_.begin(), ram_.end(), 0);
}

uint32_t Rdram::read32(uint32_t addr)
{
	// each byte wraps on its own, so a word may straddle the end of the store
	uint32_t ret = 0;
	for (uint32_t i = 0; i < 4; ++i)
		ret = (ret << 8) | ram_[(offset(addr) + i) % size()];

	return ret;
}

void Rdram::write32(uint32_t addr, uint32_t val)
{
	for (uint32_t i = 0; i < 4; ++i)
		ram_[(offset(addr) + i) % size()] = uint8_t(val >> (24 - 8 * i));
}

}
