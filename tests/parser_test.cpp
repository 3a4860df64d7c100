#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <vector>

#include "ast.hpp"
#include "dice_error.hpp"
#include "field_splitter.hpp"
#include "parser.hpp"
#include "scripted_random_source.hpp"
#include "term.hpp"

using dice::AstNode;
using dice::DiceError;
using dice::DieTerm;
using dice::ErrorKind;
using dice::LiteralTerm;
using dice::OperationNode;
using dice::Operator;
using dice::Parser;
using dice::Term;
using dice::ValueNode;

namespace {

std::vector<Term> termsOf(const std::string& expression) {
    return dice::classifyFields(dice::FieldSplitter(expression).split());
}

std::unique_ptr<AstNode> parseWith(const std::string& expression, ScriptedRandomSource& random) {
    Parser parser(termsOf(expression), random);
    return parser.parse();
}

ErrorKind parseErrorKind(std::vector<Term> terms) {
    ScriptedRandomSource random({});
    try {
        Parser(std::move(terms), random).parse();
    }
    catch (const DiceError& ex) {
        return ex.kind();
    }
    ADD_FAILURE() << "ожидалась ошибка разбора";
    return ErrorKind::InvalidLiteral;
}

void forEachLeaf(const AstNode& node, const std::function<void(const ValueNode&)>& visit) {
    if (const auto* op = dynamic_cast<const OperationNode*>(&node)) {
        forEachLeaf(op->leftChild(), visit);
        forEachLeaf(op->rightChild(), visit);
        return;
    }
    visit(dynamic_cast<const ValueNode&>(node));
}

} // namespace

TEST(FindRootTest, PrefersRightmostMinus) {
    auto terms = termsOf("1+2-3-4+5");
    EXPECT_EQ(dice::findRoot(terms, 0, terms.size()), 5u);
}

TEST(FindRootTest, FallsBackToFirstPlus) {
    auto terms = termsOf("1+2+3");
    EXPECT_EQ(dice::findRoot(terms, 0, terms.size()), 1u);
}

TEST(FindRootTest, SingleOperandIsItsOwnRoot) {
    auto terms = termsOf("7");
    EXPECT_EQ(dice::findRoot(terms, 0, terms.size()), 0u);
}

TEST(FindRootTest, WorksOnSubrange) {
    auto terms = termsOf("1+2+3");
    EXPECT_EQ(dice::findRoot(terms, 2, 5), 3u);
    EXPECT_EQ(dice::findRoot(terms, 4, 5), 4u);
}

TEST(FindRootTest, EmptyRangeIsMissingOperand) {
    auto terms = termsOf("1+2");
    try {
        dice::findRoot(terms, 1, 1);
        FAIL() << "ожидалась ошибка";
    }
    catch (const DiceError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::AmbiguousOrMissingOperand);
    }
}

TEST(FindRootTest, OperandsWithoutOperatorAreAmbiguous) {
    std::vector<Term> terms = {
        {LiteralTerm{3}, "3", 0},
        {LiteralTerm{4}, "4", 2},
    };
    try {
        dice::findRoot(terms, 0, terms.size());
        FAIL() << "ожидалась ошибка";
    }
    catch (const DiceError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::AmbiguousOrMissingOperand);
        EXPECT_EQ(ex.position(), 2u);
    }
}

TEST(ParserTest, BuildsOperationNode) {
    ScriptedRandomSource random({});
    auto tree = parseWith("3+4", random);

    const auto* root = dynamic_cast<const OperationNode*>(tree.get());
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->operation(), Operator::Add);
    EXPECT_EQ(root->leftChild().value(), 3);
    EXPECT_EQ(root->rightChild().value(), 4);
    EXPECT_EQ(tree->value(), 7);
}

TEST(ParserTest, SubtractionChainsEvaluateLeftToRight) {
    ScriptedRandomSource random({});
    EXPECT_EQ(parseWith("10-3-2", random)->value(), 5);
    EXPECT_EQ(parseWith("10-3", random)->value(), 7);
}

TEST(ParserTest, RightmostMinusTakesEverythingAfterItAsRightOperand) {
    ScriptedRandomSource random({});
    // 10 - (3 + 2)
    auto tree = parseWith("10-3+2", random);
    EXPECT_EQ(tree->value(), 5);
    EXPECT_EQ(tree->toString(), "10 - 3 + 2");

    const auto* root = dynamic_cast<const OperationNode*>(tree.get());
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->operation(), Operator::Sub);
    EXPECT_EQ(root->rightChild().value(), 5);
}

TEST(ParserTest, NegativeLiteralAfterDoubleMinus) {
    ScriptedRandomSource random({});
    auto tree = parseWith("5--3", random);
    EXPECT_EQ(tree->value(), 8);
    EXPECT_EQ(tree->toString(), "5 - -3");
}

TEST(ParserTest, ExpandsMultiDieIntoSingleDice) {
    ScriptedRandomSource random({1, 2, 3});
    auto tree = parseWith("3d6", random);

    EXPECT_EQ(tree->value(), 6);
    EXPECT_EQ(random.used(), 3u);
    EXPECT_EQ(random.requestedFaces(), (std::vector<int>{6, 6, 6}));

    // Сумма вложена вправо: 1d6 + (1d6 + 1d6)
    const auto* root = dynamic_cast<const OperationNode*>(tree.get());
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->operation(), Operator::Add);
    EXPECT_NE(dynamic_cast<const ValueNode*>(&root->leftChild()), nullptr);
    EXPECT_NE(dynamic_cast<const OperationNode*>(&root->rightChild()), nullptr);

    int leaves = 0;
    forEachLeaf(*tree, [&leaves](const ValueNode& leaf) {
        ++leaves;
        EXPECT_TRUE(leaf.isDie());
        EXPECT_EQ(leaf.text(), "1d6");
        EXPECT_EQ(leaf.faceCount(), 6);
    });
    EXPECT_EQ(leaves, 3);
}

TEST(ParserTest, RollsDiceLeftToRight) {
    ScriptedRandomSource random({2, 5, 4});
    auto tree = parseWith("2d6+3-1d4", random);

    EXPECT_EQ(random.requestedFaces(), (std::vector<int>{6, 6, 4}));
    EXPECT_EQ(tree->toString(), "2(d6) + 5(d6) + 3 - !*4*!(d4)");
    EXPECT_EQ(tree->value(), 6);
}

TEST(ParserTest, SingleDieIsOneLeaf) {
    ScriptedRandomSource random({13});
    auto tree = parseWith("d20", random);

    const auto* leaf = dynamic_cast<const ValueNode*>(tree.get());
    ASSERT_NE(leaf, nullptr);
    EXPECT_TRUE(leaf->isDie());
    EXPECT_EQ(leaf->faceCount(), 20);
    EXPECT_EQ(leaf->value(), 13);
    EXPECT_EQ(leaf->text(), "d20");
}

TEST(ParserTest, LiteralLeafHasNoFaces) {
    ScriptedRandomSource random({});
    auto tree = parseWith("42", random);

    const auto* leaf = dynamic_cast<const ValueNode*>(tree.get());
    ASSERT_NE(leaf, nullptr);
    EXPECT_FALSE(leaf->isDie());
    EXPECT_FALSE(leaf->faceCount().has_value());
    EXPECT_EQ(random.used(), 0u);
}

TEST(ParserTest, OperatorAtBoundaryIsMalformed) {
    EXPECT_EQ(parseErrorKind(termsOf("3+")), ErrorKind::MalformedOperatorPlacement);
    EXPECT_EQ(parseErrorKind(termsOf("3-")), ErrorKind::MalformedOperatorPlacement);
    EXPECT_EQ(parseErrorKind({{Operator::Add, "+", 0}, {LiteralTerm{3}, "3", 1}}),
              ErrorKind::MalformedOperatorPlacement);
    EXPECT_EQ(parseErrorKind({{Operator::Sub, "-", 0}}), ErrorKind::MalformedOperatorPlacement);
}

TEST(ParserTest, EmptySequenceIsMissingOperand) {
    EXPECT_EQ(parseErrorKind({}), ErrorKind::AmbiguousOrMissingOperand);
}

TEST(ParserTest, AdjacentOperandsAreAmbiguous) {
    std::vector<Term> terms = {
        {LiteralTerm{1}, "1", 0},
        {Operator::Add, "+", 1},
        {DieTerm{1, 6}, "d6", 2},
        {LiteralTerm{4}, "4", 5},
    };
    EXPECT_EQ(parseErrorKind(std::move(terms)), ErrorKind::AmbiguousOrMissingOperand);
}

TEST(ParserTest, DebugStringShowsStructure) {
    ScriptedRandomSource random({3});
    auto tree = parseWith("1d6+2", random);
    EXPECT_EQ(dice::describeTree(*tree), "ParseTree<OpNode<ValueNode<3,d6> + ValueNode<2>>>");
}

TEST(ParserTest, RejectsSequenceLongerThanLimit) {
    std::vector<Term> terms;
    for (std::size_t i = 0; i <= dice::kMaxTerms; ++i) {
        if (i % 2 == 0) {
            terms.push_back({DieTerm{1, 6}, "d6", i});
        } else {
            terms.push_back({Operator::Add, "+", i});
        }
    }
    ASSERT_EQ(terms.size(), dice::kMaxTerms + 1);

    ScriptedRandomSource random({});
    try {
        Parser(std::move(terms), random).parse();
        FAIL() << "ожидалась ошибка";
    }
    catch (const DiceError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::AmbiguousOrMissingOperand);
        EXPECT_EQ(ex.position(), dice::kMaxTerms);
    }
    EXPECT_EQ(random.used(), 0u);
}
