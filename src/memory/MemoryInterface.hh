#ifndef MEMORYINTERFACE_HH
#define MEMORYINTERFACE_HH

#include <cstdint>

namespace gbcore {

/** The bus as seen by the CPU core. All methods may throw MemoryFault. */
class MemoryInterface
{
public:
	MemoryInterface(const MemoryInterface&) = delete;
	MemoryInterface& operator=(const MemoryInterface&) = delete;

	[[nodiscard]] virtual uint8_t readByte(uint16_t address) = 0;
	virtual void writeByte(uint16_t address, uint8_t value) = 0;

	/** Read without side effects (no read handlers are triggered), for
	  * inspecting memory from outside the CPU. The core itself never
	  * calls it.
	  */
	[[nodiscard]] virtual uint8_t peekByte(uint16_t address) const = 0;

protected:
	MemoryInterface() = default;
	~MemoryInterface() = default;
};

} // namespace gbcore

#endif
