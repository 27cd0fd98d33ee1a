#ifndef SM83_HH
#define SM83_HH

namespace gbcore {

/** Instruction timings of the SM83, in T-cycles (4 per machine cycle).
  * For conditional instructions the _A value is the cost when the branch
  * is taken, _B when it is not.
  */
struct SM83
{
	static constexpr int
	CC_NOP       = 4,
	CC_HALT      = 4,
	CC_STOP      = 4,

	CC_LD_R_R    = 4,
	CC_LD_R_N    = 8,
	CC_LD_R_SS   = 8,     // LD r,(rr) and LD (rr),r
	CC_LD_HL_N   = 12,
	CC_LD_A_NN   = 16,    // LD A,(nn) and LD (nn),A
	CC_LD_NN_SP  = 20,
	CC_LDH       = 12,
	CC_LD_C      = 8,     // LD A,(C) and LD (C),A
	CC_LD_SS_NN  = 12,
	CC_LD_SP_HL  = 8,
	CC_LD_HL_SPE = 12,
	CC_PUSH      = 16,
	CC_POP       = 12,

	CC_ALU_R     = 4,
	CC_ALU_N     = 8,
	CC_ALU_XHL   = 8,
	CC_INC_R     = 4,
	CC_INC_SS    = 8,
	CC_INC_XHL   = 12,
	CC_ADD_HL_SS = 8,
	CC_ADD_SP_E  = 16,
	CC_ACC       = 4,     // RLCA RRCA RLA RRA DAA CPL SCF CCF

	CC_JP_A      = 16,    CC_JP_B   = 12,
	CC_JP_HL     = 4,
	CC_JR_A      = 12,    CC_JR_B   = 8,
	CC_CALL_A    = 24,    CC_CALL_B = 12,
	CC_RET       = 16,
	CC_RET_A     = 20,    CC_RET_B  = 8,
	CC_RST       = 16,

	CC_CB_R      = 8,
	CC_CB_XHL    = 16,
	CC_BIT_XHL   = 12;
};

} // namespace gbcore

#endif
