#ifndef N64CORE_DEVICE_HPP
#define N64CORE_DEVICE_HPP

#include <cstdint>

namespace n64core
{

/// Interface to a memory-mapped device (32 bit word port)
class Device
{
public:
	virtual ~Device() = default;

	/// read one word at 'addr'
	virtual uint32_t read32(uint32_t addr) = 0;

	/// write one word at 'addr'
	virtual void     write32(uint32_t addr, uint32_t val) = 0;
};

} // namespace

#endif
