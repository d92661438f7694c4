// File: tests/unit/test_ir_verifier.cpp
// Purpose: Structural checks of the IR verifier and the textual serializer.
// Key invariants: Malformed modules are rejected with a P4000 diagnostic that
//                 names the function; well-formed modules pass unchanged.
// Ownership/Lifetime: Modules are built by value inside each test.
// Links: src/ir/Verifier.cpp, src/ir/Serializer.cpp

#include "IrTestUtil.hpp"
#include "ir/Intrinsics.hpp"
#include "ir/Serializer.hpp"
#include "ir/Verifier.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace perc::ir;
using perc::test::constantMain;
using perc::test::makeInstr;
using perc::test::moduleWith;

namespace
{

void expectRejected(const Module &module, const std::string &fragment)
{
    auto ok = Verifier::verify(module);
    ASSERT_FALSE(ok.hasValue()) << "expected: " << fragment;
    EXPECT_EQ(ok.error().code, "P4000");
    EXPECT_NE(ok.error().message.find(fragment), std::string::npos) << ok.error().message;
}

} // namespace

TEST(IrVerifier, AcceptsMinimalMain)
{
    EXPECT_TRUE(Verifier::verify(moduleWith({constantMain(0)})).hasValue());
}

TEST(IrVerifier, EntryMustExistAndReturnAValue)
{
    expectRejected(moduleWith({constantMain(0)}, 3), "entry function missing");

    Function fn;
    fn.name = "main";
    fn.body.push_back(makeInstr(Opcode::Ret));
    expectRejected(moduleWith({fn}), "entry function must take no parameters");
}

TEST(IrVerifier, SlotsMustBeInRange)
{
    Function fn = constantMain(1);
    fn.body.insert(fn.body.begin() + 1, makeInstr(Opcode::Neg, 0, {4}));
    expectRejected(moduleWith({fn}), "operand slot out of range");

    Function dst = constantMain(1);
    dst.body.insert(dst.body.begin() + 1, makeInstr(Opcode::Neg, 9, {0}));
    expectRejected(moduleWith({dst}), "destination slot out of range");
}

TEST(IrVerifier, OperandCountsFollowOpcodeTable)
{
    Function fn = constantMain(1);
    fn.body.insert(fn.body.begin() + 1, makeInstr(Opcode::Add, 0, {0}));
    expectRejected(moduleWith({fn}), "wrong operand count");
}

TEST(IrVerifier, BranchesNeedDefinedLabels)
{
    Function fn = constantMain(1);
    fn.labelCount = 1;
    fn.body.insert(fn.body.begin() + 1, makeInstr(Opcode::Jz, kNoSlot, {0}, 0, 0));
    expectRejected(moduleWith({fn}), "branch to undefined label .L0");

    Function twice = constantMain(1);
    twice.labelCount = 1;
    twice.body.insert(twice.body.begin(), makeInstr(Opcode::Label, kNoSlot, {}, 0, 0));
    twice.body.insert(twice.body.begin(), makeInstr(Opcode::Label, kNoSlot, {}, 0, 0));
    expectRejected(moduleWith({twice}), "label defined twice");
}

TEST(IrVerifier, CallsMatchCallee)
{
    Function callee;
    callee.name = "f";
    callee.paramCount = 1;
    callee.localWords = {1};
    callee.body.push_back(makeInstr(Opcode::Ret));

    Function main = constantMain(0);
    main.body.insert(main.body.begin() + 1, makeInstr(Opcode::Call, kNoSlot, {}, 0, 1));
    expectRejected(moduleWith({main, callee}), "argument count mismatch");

    Function takesResult = constantMain(0);
    takesResult.slotCount = 2;
    takesResult.body.insert(takesResult.body.begin() + 1,
                            makeInstr(Opcode::Call, 1, {0}, 0, 1));
    expectRejected(moduleWith({takesResult, callee}), "result taken from a void function");
}

TEST(IrVerifier, IntrinsicsAreChecked)
{
    Function unknown = constantMain(0);
    unknown.body.insert(unknown.body.begin() + 1, makeInstr(Opcode::Intrinsic, kNoSlot, {0}, 0, 77));
    expectRejected(moduleWith({unknown}), "unknown intrinsic");

    Function arity = constantMain(0);
    arity.body.insert(arity.body.begin() + 1,
                      makeInstr(Opcode::Intrinsic,
                                kNoSlot,
                                {},
                                0,
                                static_cast<uint32_t>(IntrinsicId::Println)));
    expectRejected(moduleWith({arity}), "intrinsic argument count mismatch");
}

TEST(IrVerifier, BodyMustEndWithMatchingRet)
{
    Function fn = constantMain(0);
    fn.body.pop_back();
    expectRejected(moduleWith({fn}), "body does not end with ret");

    Function bare = constantMain(0);
    bare.body.back().operands.clear();
    expectRejected(moduleWith({bare}), "ret does not match the function result");
}

TEST(IrVerifier, LocalsAndStringsAreInRange)
{
    Function fn = constantMain(0);
    fn.body.insert(fn.body.begin() + 1, makeInstr(Opcode::StoreLocal, kNoSlot, {0}, 0, 0));
    expectRejected(moduleWith({fn}), "local id out of range");

    Function str = constantMain(0);
    str.slotCount = 2;
    str.body.insert(str.body.begin() + 1, makeInstr(Opcode::StrAddr, 1, {}, 0, 0));
    expectRejected(moduleWith({str}), "string id out of range");
}

TEST(IrVerifier, ParametersAreOneWordLocals)
{
    Function callee;
    callee.name = "f";
    callee.paramCount = 1;
    callee.localWords = {4};
    callee.body.push_back(makeInstr(Opcode::Ret));
    expectRejected(moduleWith({constantMain(0), callee}), "parameter local is not one word");
}

TEST(IrSerializer, QuotesControlBytes)
{
    EXPECT_EQ(Serializer::quote("a\"b\\\n\t\x01"), "\"a\\\"b\\\\\\n\\t\\x01\"");
}

TEST(IrSerializer, WritesStringsAndLabels)
{
    Function fn;
    fn.name = "main";
    fn.returnsValue = true;
    fn.slotCount = 2;
    fn.labelCount = 1;
    fn.body.push_back(makeInstr(Opcode::StrAddr, 0, {}, 0, 0));
    fn.body.push_back(makeInstr(Opcode::Intrinsic,
                                kNoSlot,
                                {0},
                                0,
                                static_cast<uint32_t>(IntrinsicId::PrintlnStr)));
    fn.body.push_back(makeInstr(Opcode::Label, kNoSlot, {}, 0, 0));
    fn.body.push_back(makeInstr(Opcode::Const, 1, {}, -7));
    fn.body.push_back(makeInstr(Opcode::Ret, kNoSlot, {1}));
    Module module = moduleWith({fn});
    module.strings.push_back("hi\n");

    const std::string expected = "entry main\n"
                                 "string 0 \"hi\\n\"\n"
                                 "\n"
                                 "func main(params=0) locals=[] slots=2 -> value\n"
                                 "  %0 = str #0\n"
                                 "  intr PrintlnStr(%0)\n"
                                 ".L0:\n"
                                 "  %1 = const -7\n"
                                 "  ret %1\n"
                                 "end\n";
    EXPECT_EQ(Serializer::toString(module), expected);
    EXPECT_TRUE(Verifier::verify(module).hasValue());
}
