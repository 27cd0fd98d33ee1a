#ifndef FLATMEMORY_HH
#define FLATMEMORY_HH

#include "MemoryInterface.hh"

#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace gbcore {

/** Result of a read handler: either replace the stored byte or let the
  * read pass through to the backing buffer. */
class MemRead
{
public:
	[[nodiscard]] static MemRead passThrough() { return MemRead(false, 0); }
	[[nodiscard]] static MemRead replace(uint8_t value) { return MemRead(true, value); }

	[[nodiscard]] bool isReplaced() const { return replaced; }
	[[nodiscard]] uint8_t getValue() const { return value; }

private:
	MemRead(bool replaced_, uint8_t value_) : replaced(replaced_), value(value_) {}

	bool replaced;
	uint8_t value;
};

/** Result of a write handler: store the written byte, store another byte
  * instead, or drop the write. */
class MemWrite
{
public:
	enum Action : uint8_t { PASS_THROUGH, REPLACE, BLOCK };

	[[nodiscard]] static MemWrite passThrough() { return MemWrite(PASS_THROUGH, 0); }
	[[nodiscard]] static MemWrite replace(uint8_t value) { return MemWrite(REPLACE, value); }
	[[nodiscard]] static MemWrite block() { return MemWrite(BLOCK, 0); }

	[[nodiscard]] Action getAction() const { return action; }
	[[nodiscard]] uint8_t getValue() const { return value; }

private:
	MemWrite(Action action_, uint8_t value_) : action(action_), value(value_) {}

	Action action;
	uint8_t value;
};

/** Hooks for one address region. An empty std::function behaves as
  * pass-through. 'stored' is the byte currently in the backing buffer.
  */
struct MemHandler
{
	std::function<MemRead(uint16_t address, uint8_t stored)> onRead;
	std::function<MemWrite(uint16_t address, uint8_t value)> onWrite;
};

/** A plain byte buffer with optional handlers on address regions. */
class FlatMemory final : public MemoryInterface
{
public:
	explicit FlatMemory(unsigned size = 0x10000);

	[[nodiscard]] uint8_t readByte(uint16_t address) override;
	void writeByte(uint16_t address, uint8_t value) override;
	[[nodiscard]] uint8_t peekByte(uint16_t address) const override;

	/** Register 'handler' for the inclusive range [first, last].
	  * Throws CoreException when the range is empty, out of range or
	  * overlaps an already registered region.
	  */
	void registerHandler(uint16_t first, uint16_t last, MemHandler handler);

	/** Copy 'data' into the buffer starting at 'address', bypassing
	  * handlers. */
	void load(uint16_t address, std::span<const uint8_t> data);

	[[nodiscard]] unsigned getSize() const { return unsigned(buffer.size()); }

private:
	struct Region {
		uint16_t first;
		uint16_t last;
		MemHandler handler;
	};

	void checkAddress(unsigned address) const;
	[[nodiscard]] Region* findRegion(uint16_t address);

	std::vector<uint8_t> buffer;
	std::vector<Region> regions;
};

} // namespace gbcore

#endif
