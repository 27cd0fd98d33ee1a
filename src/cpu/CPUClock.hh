#ifndef CPUCLOCK_HH
#define CPUCLOCK_HH

#include <cstdint>
#include <functional>
#include <utility>

namespace gbcore {

/** Counts the T-cycles consumed by executed instructions.
  * Timing itself is not modeled: the optional hook lets an embedding
  * system consume the cycles (e.g. to advance video or timers).
  */
class CPUClock
{
public:
	using Hook = std::function<void(unsigned ticks)>;

	void setHook(Hook hook_) { hook = std::move(hook_); }

	void add(unsigned ticks) {
		total += ticks;
		if (hook) hook(ticks);
	}

	[[nodiscard]] uint64_t getTotalTicks() const { return total; }
	void reset() { total = 0; }

private:
	Hook hook;
	uint64_t total = 0;
};

} // namespace gbcore

#endif
