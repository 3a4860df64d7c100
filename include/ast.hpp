#pragma once

#include <memory>
#include <optional>
#include <string>

#include "term.hpp"

namespace dice {

class RandomSource;

// Базовый класс для узла дерева броска.
// Значение узла вычисляется один раз при создании и больше не меняется.
class AstNode {
public:
    virtual ~AstNode() = default;

    // Значение поддерева
    virtual long long value() const = 0;

    // Человекочитаемая запись: "4(d6) + !*6*!(d6) + 3"
    virtual std::string toString() const = 0;

    // Отладочная запись структуры дерева
    virtual std::string toDebugString() const = 0;
};

// Узел бинарной операции (+ или -)
class OperationNode final : public AstNode {
public:
    OperationNode(Operator op, std::unique_ptr<AstNode> left, std::unique_ptr<AstNode> right);

    long long value() const override { return result; }
    std::string toString() const override;
    std::string toDebugString() const override;

    Operator operation() const { return op; }
    const AstNode& leftChild() const { return *left; }
    const AstNode& rightChild() const { return *right; }

private:
    Operator op;
    std::unique_ptr<AstNode> left;  // Левый операнд
    std::unique_ptr<AstNode> right; // Правый операнд
    long long result;
};

// Лист дерева: один кубик или число
class ValueNode final : public AstNode {
public:
    // Бросок одного кубика из источника random
    ValueNode(std::string text, int faces, RandomSource& random);

    // Число
    ValueNode(std::string text, int literal);

    long long value() const override { return result; }
    std::string toString() const override;
    std::string toDebugString() const override;

    bool isDie() const { return faces.has_value(); }

    // Число граней (только для кубика)
    std::optional<int> faceCount() const { return faces; }

    const std::string& text() const { return field; }

private:
    std::string field;        // Исходный текст терма
    std::optional<int> faces; // Пусто для числа
    long long result;
};

// Отладочная запись всего дерева: "ParseTree<OpNode<...>>"
std::string describeTree(const AstNode& root);

} // namespace dice
