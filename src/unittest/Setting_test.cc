#include "catch.hpp"

#include "BooleanSetting.hh"
#include "CaptureListener.hh"
#include "CommandException.hh"
#include "CPUCore.hh"
#include "CPUSettings.hh"
#include "EnumSetting.hh"
#include "FlatMemory.hh"
#include "GlobalCliComm.hh"
#include "Interpreter.hh"

#include <array>
#include <memory>
#include <string>

using namespace gbcore;

namespace {

enum class Colour { RED, GREEN, BLUE };

struct Fixture
{
	Fixture() {
		listener = static_cast<CaptureListener*>(
			cliComm.addListener(std::make_unique<CaptureListener>()));
	}

	GlobalCliComm cliComm;
	CaptureListener* listener;
	Interpreter interp;
};

} // namespace

TEST_CASE("BooleanSetting")
{
	Fixture f;
	BooleanSetting setting(f.interp, f.cliComm, "flag", false);
	CHECK(setting.getTypeString() == "boolean");
	CHECK(!setting.getBoolean());
	CHECK(f.interp.execute("set flag").getString() == "false");

	SECTION("normalized from Tcl") {
		f.interp.execute("set flag on");
		CHECK(setting.getBoolean());
		CHECK(setting.getValue().getString() == "true");
		CHECK(f.interp.execute("set flag").getString() == "true");
		REQUIRE(f.listener->updates.size() == 1);
		CHECK(f.listener->updates[0].type == CliComm::UpdateType::SETTING);
		CHECK(f.listener->updates[0].name == "flag");
		CHECK(f.listener->updates[0].value == "true");

		// same value again, no update
		f.interp.execute("set flag yes");
		CHECK(f.listener->updates.size() == 1);
	}
	SECTION("invalid value") {
		CHECK_THROWS_AS(f.interp.execute("set flag maybe"), CommandException);
		CHECK(!setting.getBoolean());
		CHECK(f.interp.execute("set flag").getString() == "false");
		CHECK_THROWS_AS(setting.setValue(TclObject("perhaps")), CommandException);
		CHECK(f.listener->updates.empty());
	}
	SECTION("from C++") {
		setting.setBoolean(true);
		CHECK(f.interp.execute("set flag").getString() == "true");
	}
	SECTION("unset restores the default") {
		setting.setBoolean(true);
		f.interp.execute("unset flag");
		CHECK(!setting.getBoolean());
		CHECK(f.interp.execute("set flag").getString() == "false");
		f.interp.execute("set flag 1"); // trace is still active
		CHECK(setting.getBoolean());
	}
}

TEST_CASE("EnumSetting")
{
	Fixture f;
	EnumSetting<Colour> setting(f.interp, f.cliComm, "colour",
		Colour::GREEN,
		EnumSetting<Colour>::Map{
			{"red",   Colour::RED},
			{"green", Colour::GREEN},
			{"blue",  Colour::BLUE}});
	CHECK(setting.getTypeString() == "enumeration");
	CHECK(setting.getEnum() == Colour::GREEN);
	CHECK(setting.getString() == "green");
	CHECK(setting.getDefaultValue().getString() == "green");

	SECTION("caseless, stored in canonical form") {
		f.interp.execute("set colour BLUE");
		CHECK(setting.getEnum() == Colour::BLUE);
		CHECK(f.interp.execute("set colour").getString() == "blue");
	}
	SECTION("invalid value") {
		try {
			setting.setValue(TclObject("purple"));
			FAIL("value was accepted");
		} catch (CommandException& e) {
			CHECK(e.getMessage().find("not a valid value") != std::string::npos);
		}
		CHECK(setting.getEnum() == Colour::GREEN);
	}
	SECTION("observers") {
		struct Counter final : Observer<Setting> {
			void update(const Setting&) noexcept override { ++count; }
			int count = 0;
		} counter;
		setting.attach(counter);
		setting.setEnum(Colour::RED);
		setting.setEnum(Colour::RED);
		CHECK(counter.count == 1);
		setting.detach(counter);
	}
}

TEST_CASE("CPUSettings")
{
	Fixture f;
	CPUSettings settings(f.interp, f.cliComm);
	CHECK(settings.getConditionEncoding() == ConditionEncoding::CONVENTIONAL);
	CHECK(settings.getSubtractFlags() == SubtractFlags::BORROW);
	CHECK(!settings.getTrace());

	CPUCore core(f.cliComm, settings);
	CHECK(core.getConditionEncoding() == ConditionEncoding::CONVENTIONAL);

	SECTION("condition encoding") {
		f.interp.execute("set cpu_condition_encoding mask");
		CHECK(core.getConditionEncoding() == ConditionEncoding::MASK);

		FlatMemory mem;
		mem.load(0x0000, std::array<uint8_t, 2>{0xC2, 0x00}); // JP NZ,...
		mem.load(0x0002, std::array<uint8_t, 1>{0x40});
		core.getRegisters().setF(CPURegs::N_FLAG | CPURegs::Z_FLAG);
		CHECK(core.step(mem).isContinue());
		CHECK(core.getPC() == 0x4000);
	}
	SECTION("subtract flags") {
		f.interp.execute("set cpu_subtract_flags No_Borrow");
		CHECK(core.getSubtractFlags() == SubtractFlags::NO_BORROW);
		CHECK_THROWS_AS(f.interp.execute("set cpu_subtract_flags carry"), CommandException);
		CHECK(core.getSubtractFlags() == SubtractFlags::NO_BORROW);
	}
	SECTION("trace") {
		f.interp.execute("set cpu_trace true");
		CHECK(core.getTrace());
		FlatMemory mem;
		CHECK(core.step(mem).isContinue()); // NOP
		CHECK(f.listener->count(CliComm::LogLevel::INFO) == 1);
		f.interp.execute("set cpu_trace off");
		CHECK(!core.getTrace());
	}
}
