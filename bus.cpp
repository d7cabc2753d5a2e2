#include "bus.hpp"
#include <utility>

namespace
{
/// accesses are forced to word alignment
constexpr uint32_t ALIGN_MASK = ~uint32_t(3);
}

namespace n64core
{
Bus::Range::Range(uint32_t b, uint32_t s, std::shared_ptr<Device> d)
: base(b)
, sz(s)
, dev(std::move(d))
{
}

bool Bus::Range::covers(uint32_t addr) const
{
	// base is word aligned, offset wraps at 2^32
	return addr - base < sz;
}

Bus::Bus()
{
}

void Bus::addDevice(uint32_t base, uint32_t sz, std::shared_ptr<Device> dev)
{
	if (sz == 0 || !dev)
		return; // nothing to map

	// first whole word at or above base
	const uint32_t first = (base + 3) & ALIGN_MASK;
	const uint32_t skip = first - base;
	if (skip >= sz)
		return; // no aligned word inside the range

	ranges_.emplace_back(first, sz - skip, std::move(dev));
}

Device* Bus::find(uint32_t addr) const
{
	addr &= ALIGN_MASK;

	// newest first
	for (auto i = ranges_.rbegin(); i != ranges_.rend(); ++i)
	{
		if (i->covers(addr))
			return i->dev.get();
	}
	return nullptr;
}

uint32_t Bus::read32(uint32_t addr)
{
	Device *const dev = find(addr);
	if (!dev)
		return 0;

	return dev->read32(addr & ALIGN_MASK);
}

void Bus::write32(uint32_t addr, uint32_t val)
{
	Device *const dev = find(addr);
	if (dev)
		dev->write32(addr & ALIGN_MASK, val);
}

}
