#include "FlatMemory.hh"
#include "MemoryFault.hh"
#include "CoreException.hh"
#include "strCat.hh"

#include <algorithm>
#include <utility>

namespace gbcore {

[[nodiscard]] static unsigned checkSize(unsigned size)
{
	if (size == 0 || size > 0x10000) {
		throw CoreException("Invalid memory size: ", size);
	}
	return size;
}

FlatMemory::FlatMemory(unsigned size)
	: buffer(checkSize(size), 0)
{
}

void FlatMemory::checkAddress(unsigned address) const
{
	if (address >= buffer.size()) {
		throw MemoryFault("Address #", hex_string<4>(address),
		                  " is outside of memory (size #", hex_string<5>(buffer.size()), ')');
	}
}

FlatMemory::Region* FlatMemory::findRegion(uint16_t address)
{
	auto it = std::ranges::find_if(regions, [&](const Region& r) {
		return (r.first <= address) && (address <= r.last);
	});
	return (it != regions.end()) ? &*it : nullptr;
}

uint8_t FlatMemory::readByte(uint16_t address)
{
	checkAddress(address);
	uint8_t stored = buffer[address];
	if (auto* region = findRegion(address); region && region->handler.onRead) {
		auto result = region->handler.onRead(address, stored);
		if (result.isReplaced()) return result.getValue();
	}
	return stored;
}

void FlatMemory::writeByte(uint16_t address, uint8_t value)
{
	checkAddress(address);
	if (auto* region = findRegion(address); region && region->handler.onWrite) {
		auto result = region->handler.onWrite(address, value);
		switch (result.getAction()) {
		case MemWrite::BLOCK:
			return;
		case MemWrite::REPLACE:
			value = result.getValue();
			break;
		case MemWrite::PASS_THROUGH:
			break;
		}
	}
	buffer[address] = value;
}

uint8_t FlatMemory::peekByte(uint16_t address) const
{
	checkAddress(address);
	return buffer[address];
}

void FlatMemory::registerHandler(uint16_t first, uint16_t last, MemHandler handler)
{
	if (first > last) {
		throw CoreException("Invalid handler region #", hex_string<4>(first),
		                    "-#", hex_string<4>(last));
	}
	checkAddress(last);
	for (const auto& r : regions) {
		if ((first <= r.last) && (r.first <= last)) {
			throw CoreException("Handler region #", hex_string<4>(first), "-#",
			                    hex_string<4>(last), " overlaps region #",
			                    hex_string<4>(r.first), "-#", hex_string<4>(r.last));
		}
	}
	regions.push_back(Region{first, last, std::move(handler)});
}

void FlatMemory::load(uint16_t address, std::span<const uint8_t> data)
{
	if (data.empty()) return;
	checkAddress(unsigned(address) + unsigned(data.size()) - 1);
	std::ranges::copy(data, buffer.begin() + address);
}

} // namespace gbcore
