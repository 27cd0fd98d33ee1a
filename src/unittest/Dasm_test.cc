#include "catch.hpp"

#include "Dasm.hh"
#include "Decoder.hh"

#include "strCat.hh"
#include "xrange.hh"

#include <array>
#include <initializer_list>
#include <iostream>
#include <set>
#include <span>
#include <string>
#include <vector>

using namespace gbcore;

[[nodiscard]] static std::string dasmString(std::initializer_list<uint8_t> bytes, uint16_t pc = 0x1234)
{
	std::vector<uint8_t> buf(bytes);
	std::string result;
	auto len = dasm(buf, pc, result);
	CHECK(len == buf.size());
	return result;
}

TEST_CASE("dasm: every assigned opcode is unique")
{
	std::set<std::string, std::less<>> allInstructions;
	std::string line;
	unsigned count = 0;

	auto check = [&](std::span<const uint8_t> opcode) {
		auto len = instructionLength(opcode);
		if (!len) return;
		++count;
		line.clear();
		auto dasmLen = dasm(opcode.first(*len), 0x1234, line);
		CHECK(dasmLen == *len);
		auto [it, inserted] = allInstructions.insert(line);
		CHECK(inserted);
		if (dasmLen != *len || !inserted) {
			std::string info;
			for (auto i : xrange(*len)) {
				strAppend(info, ' ', hex_string<2>(opcode[i]));
			}
			std::cout << "opcode:" << info << " (" << line << ")\n";
		}
	};

	for (auto op : xrange(256u)) {
		std::array<uint8_t, 3> base = {uint8_t(op), 0, 0};
		if (op != 0xCB) check(base);
		std::array<uint8_t, 2> extended = {0xCB, uint8_t(op)};
		check(extended);
	}
	CHECK(count == (256 - 15) + 256); // 14 unassigned, plus the prefix
}

TEST_CASE("dasm: syntax")
{
	CHECK(dasmString({0x00}) == "nop");
	CHECK(dasmString({0x76}) == "halt");
	CHECK(dasmString({0x10, 0x00}) == "stop");
	CHECK(dasmString({0x06, 0x2A}) == "ld b,#2a");
	CHECK(dasmString({0x21, 0x34, 0x12}) == "ld hl,#1234");
	CHECK(dasmString({0x2A}) == "ld a,(hl+)");
	CHECK(dasmString({0x32}) == "ld (hl-),a");
	CHECK(dasmString({0x36, 0xFF}) == "ld (hl),#ff");
	CHECK(dasmString({0x08, 0x34, 0x12}) == "ld (#1234),sp");
	CHECK(dasmString({0xF0, 0x44}) == "ldh a,(#44)");
	CHECK(dasmString({0xE2}) == "ld (c),a");
	CHECK(dasmString({0xF8, 0x05}) == "ld hl,sp+#05");
	CHECK(dasmString({0xF8, 0xFB}) == "ld hl,sp-#05");
	CHECK(dasmString({0xE8, 0x80}) == "add sp,-#80");
	CHECK(dasmString({0xF5}) == "push af");
	CHECK(dasmString({0xD1}) == "pop de");
	CHECK(dasmString({0x80}) == "add a,b");
	CHECK(dasmString({0xCE, 0x01}) == "adc a,#01");
	CHECK(dasmString({0x96}) == "sub (hl)");
	CHECK(dasmString({0x9F}) == "sbc a,a");
	CHECK(dasmString({0xFE, 0x10}) == "cp #10");
	CHECK(dasmString({0x39}) == "add hl,sp");
	CHECK(dasmString({0x33}) == "inc sp");
	CHECK(dasmString({0x35}) == "dec (hl)");
	CHECK(dasmString({0x27}) == "daa");
	CHECK(dasmString({0xC2, 0x00, 0x40}) == "jp nz,#4000");
	CHECK(dasmString({0xE9}) == "jp (hl)");
	CHECK(dasmString({0x18, 0xFE}, 0x1000) == "jr #1000");
	CHECK(dasmString({0x38, 0x10}, 0x1000) == "jr c,#1012");
	CHECK(dasmString({0xC4, 0x00, 0x80}) == "call nz,#8000");
	CHECK(dasmString({0xD8}) == "ret c");
	CHECK(dasmString({0xFF}) == "rst #38");
	CHECK(dasmString({0xCB, 0x37}) == "swap a");
	CHECK(dasmString({0xCB, 0x0E}) == "rrc (hl)");
	CHECK(dasmString({0xCB, 0x7E}) == "bit 7,(hl)");
	CHECK(dasmString({0xCB, 0x87}) == "res 0,a");
	CHECK(dasmString({0xCB, 0xD9}) == "set 3,c");
}

TEST_CASE("dasm: decoded with the mask encoding")
{
	auto bytes = std::array<uint8_t, 2>{0x30, 0x00}; // JR NC
	unsigned cursor = 0;
	auto instruction = decode(bytes, cursor, ConditionEncoding::MASK);
	std::string line;
	dasm(instruction, 0x0102, line);
	CHECK(line == "jr nc,#0102");
}

TEST_CASE("dasm: invalid bytes")
{
	std::string line;
	SECTION("unassigned") {
		auto bytes = std::array<uint8_t, 1>{0xDD};
		CHECK(dasm(bytes, 0, line) == 1);
		CHECK(line == "db #dd");
	}
	SECTION("truncated") {
		auto bytes = std::array<uint8_t, 2>{0xC3, 0x00};
		CHECK(dasm(bytes, 0, line) == 1);
		CHECK(line == "db #c3");
	}
	SECTION("empty") {
		CHECK(dasm(std::span<const uint8_t>(), 0, line) == 0);
		CHECK(line.empty());
	}
}
