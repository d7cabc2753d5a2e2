#ifndef N64CORE_BUS_HPP
#define N64CORE_BUS_HPP

#include "device.hpp"
#include <memory>
#include <vector>

namespace n64core
{
/// Address range dispatch of word accesses to registered devices
class Bus : public Device
{
public:
	Bus();

	/// map 'dev' at every aligned word in [base, base+sz)
	/// an unaligned base starts at the next word boundary
	/// later registrations win where ranges overlap
	void addDevice(uint32_t base, uint32_t sz, std::shared_ptr<Device> dev);

	///@return device owning 'addr', or nullptr when unmapped
	Device* find(uint32_t addr) const;

	size_t numRanges() const { return ranges_.size(); }

	//---from Device
	/// unmapped reads return 0
	uint32_t read32(uint32_t addr) override;

	/// unmapped writes are dropped
	void write32(uint32_t addr, uint32_t val) override;

private:
	struct Range
	{
		uint32_t base;
		uint32_t sz;
		std::shared_ptr<Device> dev;

		Range(uint32_t b, uint32_t s, std::shared_ptr<Device> d);

		bool covers(uint32_t addr) const;
	};

	std::vector<Range> ranges_; ///< in registration order
};

} // namespace

#endif
