#pragma once

// Every assigned single-byte WebAssembly opcode: the MVP instruction set plus the sign-extension operators.
//
// Signature is the type of a function implementing the opcode: its return type is the pushed result,
// its parameters are the popped operands in operand order. For 'Special' opcodes the stack effect
// depends on context (block types, function types, local types), and the signature only records
// the fixed part of it (e.g. the i32 condition popped by 'if').
//
// memory.size and memory.grow carry a memory index, which MVP modules encode as the reserved byte 0x00.
//
#define FOR_EACH_WASM_OPCODE                                                                                                     \
  /*   Name              Encoding   Mnemonic                  Special   Immediate           Signature (pushed result / popped operands) */ \
F( UNREACHABLE,          0x00,      "unreachable",            true,     WasmImmNone,        void() )                         \
F( NOP,                  0x01,      "nop",                    false,    WasmImmNone,        void() )                         \
F( BLOCK,                0x02,      "block",                  true,     WasmImmTypeTag,     void() )                         \
F( LOOP,                 0x03,      "loop",                   true,     WasmImmTypeTag,     void() )                         \
F( IF,                   0x04,      "if",                     true,     WasmImmTypeTag,     void(int32_t) )                  \
F( ELSE,                 0x05,      "else",                   true,     WasmImmNone,        void() )                         \
F( END,                  0x0B,      "end",                    true,     WasmImmNone,        void() )                         \
F( BR,                   0x0C,      "br",                     true,     WasmImmU32,         void() )                         \
F( BR_IF,                0x0D,      "br_if",                  true,     WasmImmU32,         void(int32_t) )                  \
F( BR_TABLE,             0x0E,      "br_table",               true,     WasmImmBrTable,     void(int32_t) )                  \
F( RETURN,               0x0F,      "return",                 true,     WasmImmNone,        void() )                         \
                                                                                                                             \
F( CALL,                 0x10,      "call",                   true,     WasmImmU32,         void() )                         \
F( CALL_INDIRECT,        0x11,      "call_indirect",          true,     WasmImmU32z,        void(int32_t) )                  \
                                                                                                                             \
F( DROP,                 0x1A,      "drop",                   true,     WasmImmNone,        void() )                         \
F( SELECT,               0x1B,      "select",                 true,     WasmImmNone,        void(int32_t) )                  \
                                                                                                                             \
F( LOCAL_GET,            0x20,      "local.get",              true,     WasmImmU32,         void() )                         \
F( LOCAL_SET,            0x21,      "local.set",              true,     WasmImmU32,         void() )                         \
F( LOCAL_TEE,            0x22,      "local.tee",              true,     WasmImmU32,         void() )                         \
F( GLOBAL_GET,           0x23,      "global.get",             true,     WasmImmU32,         void() )                         \
F( GLOBAL_SET,           0x24,      "global.set",             true,     WasmImmU32,         void() )                         \
                                                                                                                             \
F( I32_LOAD,             0x28,      "i32.load",               false,    WasmImmMemArg,      int32_t(int32_t) )               \
F( I64_LOAD,             0x29,      "i64.load",               false,    WasmImmMemArg,      int64_t(int32_t) )               \
F( F32_LOAD,             0x2A,      "f32.load",               false,    WasmImmMemArg,      float(int32_t) )                 \
F( F64_LOAD,             0x2B,      "f64.load",               false,    WasmImmMemArg,      double(int32_t) )                \
                                                                                                                             \
F( I32_LOAD_8S,          0x2C,      "i32.load8_s",            false,    WasmImmMemArg,      int32_t(int32_t) )               \
F( I32_LOAD_8U,          0x2D,      "i32.load8_u",            false,    WasmImmMemArg,      int32_t(int32_t) )               \
F( I32_LOAD_16S,         0x2E,      "i32.load16_s",           false,    WasmImmMemArg,      int32_t(int32_t) )               \
F( I32_LOAD_16U,         0x2F,      "i32.load16_u",           false,    WasmImmMemArg,      int32_t(int32_t) )               \
                                                                                                                             \
F( I64_LOAD_8S,          0x30,      "i64.load8_s",            false,    WasmImmMemArg,      int64_t(int32_t) )               \
F( I64_LOAD_8U,          0x31,      "i64.load8_u",            false,    WasmImmMemArg,      int64_t(int32_t) )               \
F( I64_LOAD_16S,         0x32,      "i64.load16_s",           false,    WasmImmMemArg,      int64_t(int32_t) )               \
F( I64_LOAD_16U,         0x33,      "i64.load16_u",           false,    WasmImmMemArg,      int64_t(int32_t) )               \
F( I64_LOAD_32S,         0x34,      "i64.load32_s",           false,    WasmImmMemArg,      int64_t(int32_t) )               \
F( I64_LOAD_32U,         0x35,      "i64.load32_u",           false,    WasmImmMemArg,      int64_t(int32_t) )               \
                                                                                                                             \
F( I32_STORE,            0x36,      "i32.store",              false,    WasmImmMemArg,      void(int32_t, int32_t) )         \
F( I64_STORE,            0x37,      "i64.store",              false,    WasmImmMemArg,      void(int32_t, int64_t) )         \
F( F32_STORE,            0x38,      "f32.store",              false,    WasmImmMemArg,      void(int32_t, float) )           \
F( F64_STORE,            0x39,      "f64.store",              false,    WasmImmMemArg,      void(int32_t, double) )          \
F( I32_STORE_8,          0x3A,      "i32.store8",             false,    WasmImmMemArg,      void(int32_t, int32_t) )         \
F( I32_STORE_16,         0x3B,      "i32.store16",            false,    WasmImmMemArg,      void(int32_t, int32_t) )         \
F( I64_STORE_8,          0x3C,      "i64.store8",             false,    WasmImmMemArg,      void(int32_t, int64_t) )         \
F( I64_STORE_16,         0x3D,      "i64.store16",            false,    WasmImmMemArg,      void(int32_t, int64_t) )         \
F( I64_STORE_32,         0x3E,      "i64.store32",            false,    WasmImmMemArg,      void(int32_t, int64_t) )         \
                                                                                                                             \
F( MEMORY_SIZE,          0x3F,      "memory.size",            false,    WasmImmU32,         int32_t() )                      \
F( MEMORY_GROW,          0x40,      "memory.grow",            false,    WasmImmU32,         int32_t(int32_t) )               \
                                                                                                                             \
F( I32_CONST,            0x41,      "i32.const",              false,    WasmImmU32,         int32_t() )                      \
F( I64_CONST,            0x42,      "i64.const",              false,    WasmImmI64,         int64_t() )                      \
F( F32_CONST,            0x43,      "f32.const",              false,    WasmImmF32,         float() )                        \
F( F64_CONST,            0x44,      "f64.const",              false,    WasmImmF64,         double() )                       \
                                                                                                                             \
F( I32_EQZ,              0x45,      "i32.eqz",                false,    WasmImmNone,        int32_t(int32_t) )               \
F( I32_EQ,               0x46,      "i32.eq",                 false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_NE,               0x47,      "i32.ne",                 false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_LT_S,             0x48,      "i32.lt_s",               false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_LT_U,             0x49,      "i32.lt_u",               false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_GT_S,             0x4A,      "i32.gt_s",               false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_GT_U,             0x4B,      "i32.gt_u",               false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_LE_S,             0x4C,      "i32.le_s",               false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_LE_U,             0x4D,      "i32.le_u",               false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_GE_S,             0x4E,      "i32.ge_s",               false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_GE_U,             0x4F,      "i32.ge_u",               false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
                                                                                                                             \
F( I64_EQZ,              0x50,      "i64.eqz",                false,    WasmImmNone,        int32_t(int64_t) )               \
F( I64_EQ,               0x51,      "i64.eq",                 false,    WasmImmNone,        int32_t(int64_t, int64_t) )      \
F( I64_NE,               0x52,      "i64.ne",                 false,    WasmImmNone,        int32_t(int64_t, int64_t) )      \
F( I64_LT_S,             0x53,      "i64.lt_s",               false,    WasmImmNone,        int32_t(int64_t, int64_t) )      \
F( I64_LT_U,             0x54,      "i64.lt_u",               false,    WasmImmNone,        int32_t(int64_t, int64_t) )      \
F( I64_GT_S,             0x55,      "i64.gt_s",               false,    WasmImmNone,        int32_t(int64_t, int64_t) )      \
F( I64_GT_U,             0x56,      "i64.gt_u",               false,    WasmImmNone,        int32_t(int64_t, int64_t) )      \
F( I64_LE_S,             0x57,      "i64.le_s",               false,    WasmImmNone,        int32_t(int64_t, int64_t) )      \
F( I64_LE_U,             0x58,      "i64.le_u",               false,    WasmImmNone,        int32_t(int64_t, int64_t) )      \
F( I64_GE_S,             0x59,      "i64.ge_s",               false,    WasmImmNone,        int32_t(int64_t, int64_t) )      \
F( I64_GE_U,             0x5A,      "i64.ge_u",               false,    WasmImmNone,        int32_t(int64_t, int64_t) )      \
                                                                                                                             \
F( F32_EQ,               0x5B,      "f32.eq",                 false,    WasmImmNone,        int32_t(float, float) )          \
F( F32_NE,               0x5C,      "f32.ne",                 false,    WasmImmNone,        int32_t(float, float) )          \
F( F32_LT,               0x5D,      "f32.lt",                 false,    WasmImmNone,        int32_t(float, float) )          \
F( F32_GT,               0x5E,      "f32.gt",                 false,    WasmImmNone,        int32_t(float, float) )          \
F( F32_LE,               0x5F,      "f32.le",                 false,    WasmImmNone,        int32_t(float, float) )          \
F( F32_GE,               0x60,      "f32.ge",                 false,    WasmImmNone,        int32_t(float, float) )          \
                                                                                                                             \
F( F64_EQ,               0x61,      "f64.eq",                 false,    WasmImmNone,        int32_t(double, double) )        \
F( F64_NE,               0x62,      "f64.ne",                 false,    WasmImmNone,        int32_t(double, double) )        \
F( F64_LT,               0x63,      "f64.lt",                 false,    WasmImmNone,        int32_t(double, double) )        \
F( F64_GT,               0x64,      "f64.gt",                 false,    WasmImmNone,        int32_t(double, double) )        \
F( F64_LE,               0x65,      "f64.le",                 false,    WasmImmNone,        int32_t(double, double) )        \
F( F64_GE,               0x66,      "f64.ge",                 false,    WasmImmNone,        int32_t(double, double) )        \
                                                                                                                             \
F( I32_CLZ,              0x67,      "i32.clz",                false,    WasmImmNone,        int32_t(int32_t) )               \
F( I32_CTZ,              0x68,      "i32.ctz",                false,    WasmImmNone,        int32_t(int32_t) )               \
F( I32_POPCNT,           0x69,      "i32.popcnt",             false,    WasmImmNone,        int32_t(int32_t) )               \
F( I32_ADD,              0x6A,      "i32.add",                false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_SUB,              0x6B,      "i32.sub",                false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_MUL,              0x6C,      "i32.mul",                false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_DIV_S,            0x6D,      "i32.div_s",              false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_DIV_U,            0x6E,      "i32.div_u",              false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_REM_S,            0x6F,      "i32.rem_s",              false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_REM_U,            0x70,      "i32.rem_u",              false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_AND,              0x71,      "i32.and",                false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_OR,               0x72,      "i32.or",                 false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_XOR,              0x73,      "i32.xor",                false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_SHL,              0x74,      "i32.shl",                false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_SHR_S,            0x75,      "i32.shr_s",              false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_SHR_U,            0x76,      "i32.shr_u",              false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_ROTL,             0x77,      "i32.rotl",               false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
F( I32_ROTR,             0x78,      "i32.rotr",               false,    WasmImmNone,        int32_t(int32_t, int32_t) )      \
                                                                                                                             \
F( I64_CLZ,              0x79,      "i64.clz",                false,    WasmImmNone,        int64_t(int64_t) )               \
F( I64_CTZ,              0x7A,      "i64.ctz",                false,    WasmImmNone,        int64_t(int64_t) )               \
F( I64_POPCNT,           0x7B,      "i64.popcnt",             false,    WasmImmNone,        int64_t(int64_t) )               \
F( I64_ADD,              0x7C,      "i64.add",                false,    WasmImmNone,        int64_t(int64_t, int64_t) )      \
F( I64_SUB,              0x7D,      "i64.sub",                false,    WasmImmNone,        int64_t(int64_t, int64_t) )      \
F( I64_MUL,              0x7E,      "i64.mul",                false,    WasmImmNone,        int64_t(int64_t, int64_t) )      \
F( I64_DIV_S,            0x7F,      "i64.div_s",              false,    WasmImmNone,        int64_t(int64_t, int64_t) )      \
F( I64_DIV_U,            0x80,      "i64.div_u",              false,    WasmImmNone,        int64_t(int64_t, int64_t) )      \
F( I64_REM_S,            0x81,      "i64.rem_s",              false,    WasmImmNone,        int64_t(int64_t, int64_t) )      \
F( I64_REM_U,            0x82,      "i64.rem_u",              false,    WasmImmNone,        int64_t(int64_t, int64_t) )      \
F( I64_AND,              0x83,      "i64.and",                false,    WasmImmNone,        int64_t(int64_t, int64_t) )      \
F( I64_OR,               0x84,      "i64.or",                 false,    WasmImmNone,        int64_t(int64_t, int64_t) )      \
F( I64_XOR,              0x85,      "i64.xor",                false,    WasmImmNone,        int64_t(int64_t, int64_t) )      \
F( I64_SHL,              0x86,      "i64.shl",                false,    WasmImmNone,        int64_t(int64_t, int64_t) )      \
F( I64_SHR_S,            0x87,      "i64.shr_s",              false,    WasmImmNone,        int64_t(int64_t, int64_t) )      \
F( I64_SHR_U,            0x88,      "i64.shr_u",              false,    WasmImmNone,        int64_t(int64_t, int64_t) )      \
F( I64_ROTL,             0x89,      "i64.rotl",               false,    WasmImmNone,        int64_t(int64_t, int64_t) )      \
F( I64_ROTR,             0x8A,      "i64.rotr",               false,    WasmImmNone,        int64_t(int64_t, int64_t) )      \
                                                                                                                             \
F( F32_ABS,              0x8B,      "f32.abs",                false,    WasmImmNone,        float(float) )                   \
F( F32_NEG,              0x8C,      "f32.neg",                false,    WasmImmNone,        float(float) )                   \
F( F32_CEIL,             0x8D,      "f32.ceil",               false,    WasmImmNone,        float(float) )                   \
F( F32_FLOOR,            0x8E,      "f32.floor",              false,    WasmImmNone,        float(float) )                   \
F( F32_TRUNC,            0x8F,      "f32.trunc",              false,    WasmImmNone,        float(float) )                   \
F( F32_NEAREST,          0x90,      "f32.nearest",            false,    WasmImmNone,        float(float) )                   \
F( F32_SQRT,             0x91,      "f32.sqrt",               false,    WasmImmNone,        float(float) )                   \
F( F32_ADD,              0x92,      "f32.add",                false,    WasmImmNone,        float(float, float) )            \
F( F32_SUB,              0x93,      "f32.sub",                false,    WasmImmNone,        float(float, float) )            \
F( F32_MUL,              0x94,      "f32.mul",                false,    WasmImmNone,        float(float, float) )            \
F( F32_DIV,              0x95,      "f32.div",                false,    WasmImmNone,        float(float, float) )            \
F( F32_MIN,              0x96,      "f32.min",                false,    WasmImmNone,        float(float, float) )            \
F( F32_MAX,              0x97,      "f32.max",                false,    WasmImmNone,        float(float, float) )            \
F( F32_COPYSIGN,         0x98,      "f32.copysign",           false,    WasmImmNone,        float(float, float) )            \
                                                                                                                             \
F( F64_ABS,              0x99,      "f64.abs",                false,    WasmImmNone,        double(double) )                 \
F( F64_NEG,              0x9A,      "f64.neg",                false,    WasmImmNone,        double(double) )                 \
F( F64_CEIL,             0x9B,      "f64.ceil",               false,    WasmImmNone,        double(double) )                 \
F( F64_FLOOR,            0x9C,      "f64.floor",              false,    WasmImmNone,        double(double) )                 \
F( F64_TRUNC,            0x9D,      "f64.trunc",              false,    WasmImmNone,        double(double) )                 \
F( F64_NEAREST,          0x9E,      "f64.nearest",            false,    WasmImmNone,        double(double) )                 \
F( F64_SQRT,             0x9F,      "f64.sqrt",               false,    WasmImmNone,        double(double) )                 \
F( F64_ADD,              0xA0,      "f64.add",                false,    WasmImmNone,        double(double, double) )         \
F( F64_SUB,              0xA1,      "f64.sub",                false,    WasmImmNone,        double(double, double) )         \
F( F64_MUL,              0xA2,      "f64.mul",                false,    WasmImmNone,        double(double, double) )         \
F( F64_DIV,              0xA3,      "f64.div",                false,    WasmImmNone,        double(double, double) )         \
F( F64_MIN,              0xA4,      "f64.min",                false,    WasmImmNone,        double(double, double) )         \
F( F64_MAX,              0xA5,      "f64.max",                false,    WasmImmNone,        double(double, double) )         \
F( F64_COPYSIGN,         0xA6,      "f64.copysign",           false,    WasmImmNone,        double(double, double) )         \
                                                                                                                             \
F( I32_WRAP_I64,         0xA7,      "i32.wrap_i64",           false,    WasmImmNone,        int32_t(int64_t) )               \
F( I32_TRUNC_F32_S,      0xA8,      "i32.trunc_f32_s",        false,    WasmImmNone,        int32_t(float) )                 \
F( I32_TRUNC_F32_U,      0xA9,      "i32.trunc_f32_u",        false,    WasmImmNone,        int32_t(float) )                 \
F( I32_TRUNC_F64_S,      0xAA,      "i32.trunc_f64_s",        false,    WasmImmNone,        int32_t(double) )                \
F( I32_TRUNC_F64_U,      0xAB,      "i32.trunc_f64_u",        false,    WasmImmNone,        int32_t(double) )                \
                                                                                                                             \
F( I64_EXTEND_I32_S,     0xAC,      "i64.extend_i32_s",       false,    WasmImmNone,        int64_t(int32_t) )               \
F( I64_EXTEND_I32_U,     0xAD,      "i64.extend_i32_u",       false,    WasmImmNone,        int64_t(int32_t) )               \
F( I64_TRUNC_F32_S,      0xAE,      "i64.trunc_f32_s",        false,    WasmImmNone,        int64_t(float) )                 \
F( I64_TRUNC_F32_U,      0xAF,      "i64.trunc_f32_u",        false,    WasmImmNone,        int64_t(float) )                 \
F( I64_TRUNC_F64_S,      0xB0,      "i64.trunc_f64_s",        false,    WasmImmNone,        int64_t(double) )                \
F( I64_TRUNC_F64_U,      0xB1,      "i64.trunc_f64_u",        false,    WasmImmNone,        int64_t(double) )                \
                                                                                                                             \
F( F32_CONVERT_I32_S,    0xB2,      "f32.convert_i32_s",      false,    WasmImmNone,        float(int32_t) )                 \
F( F32_CONVERT_I32_U,    0xB3,      "f32.convert_i32_u",      false,    WasmImmNone,        float(int32_t) )                 \
F( F32_CONVERT_I64_S,    0xB4,      "f32.convert_i64_s",      false,    WasmImmNone,        float(int64_t) )                 \
F( F32_CONVERT_I64_U,    0xB5,      "f32.convert_i64_u",      false,    WasmImmNone,        float(int64_t) )                 \
F( F32_DEMOTE_F64,       0xB6,      "f32.demote_f64",         false,    WasmImmNone,        float(double) )                  \
                                                                                                                             \
F( F64_CONVERT_I32_S,    0xB7,      "f64.convert_i32_s",      false,    WasmImmNone,        double(int32_t) )                \
F( F64_CONVERT_I32_U,    0xB8,      "f64.convert_i32_u",      false,    WasmImmNone,        double(int32_t) )                \
F( F64_CONVERT_I64_S,    0xB9,      "f64.convert_i64_s",      false,    WasmImmNone,        double(int64_t) )                \
F( F64_CONVERT_I64_U,    0xBA,      "f64.convert_i64_u",      false,    WasmImmNone,        double(int64_t) )                \
F( F64_PROMOTE_F32,      0xBB,      "f64.promote_f32",        false,    WasmImmNone,        double(float) )                  \
                                                                                                                             \
F( I32_REINTERPRET_F32,  0xBC,      "i32.reinterpret_f32",    false,    WasmImmNone,        int32_t(float) )                 \
F( I64_REINTERPRET_F64,  0xBD,      "i64.reinterpret_f64",    false,    WasmImmNone,        int64_t(double) )                \
F( F32_REINTERPRET_I32,  0xBE,      "f32.reinterpret_i32",    false,    WasmImmNone,        float(int32_t) )                 \
F( F64_REINTERPRET_I64,  0xBF,      "f64.reinterpret_i64",    false,    WasmImmNone,        double(int64_t) )                \
                                                                                                                             \
F( I32_EXTEND_8S,        0xC0,      "i32.extend8_s",          false,    WasmImmNone,        int32_t(int32_t) )               \
F( I32_EXTEND_16S,       0xC1,      "i32.extend16_s",         false,    WasmImmNone,        int32_t(int32_t) )               \
F( I64_EXTEND_8S,        0xC2,      "i64.extend8_s",          false,    WasmImmNone,        int64_t(int64_t) )               \
F( I64_EXTEND_16S,       0xC3,      "i64.extend16_s",         false,    WasmImmNone,        int64_t(int64_t) )               \
F( I64_EXTEND_32S,       0xC4,      "i64.extend32_s",         false,    WasmImmNone,        int64_t(int64_t) )
