#include "ast.hpp"

#include <stdexcept>

#include "random_source.hpp"

namespace dice {

OperationNode::OperationNode(Operator op, std::unique_ptr<AstNode> left, std::unique_ptr<AstNode> right)
    : op(op), left(std::move(left)), right(std::move(right)) {
    long long leftValue = this->left->value();
    long long rightValue = this->right->value();

    switch (op) {
    case Operator::Add:
        result = leftValue + rightValue;
        break;
    case Operator::Sub:
        result = leftValue - rightValue;
        break;
    default:
        throw std::logic_error("Неизвестная бинарная операция");
    }
}

std::string OperationNode::toString() const {
    return left->toString() + ' ' + operatorSymbol(op) + ' ' + right->toString();
}

std::string OperationNode::toDebugString() const {
    return "OpNode<" + left->toDebugString() + ' ' + operatorSymbol(op) + ' ' +
           right->toDebugString() + '>';
}

ValueNode::ValueNode(std::string text, int faces, RandomSource& random)
    : field(std::move(text)), faces(faces), result(random.roll(faces)) {
    if (result < 1 || result > faces) {
        throw std::logic_error("Источник случайных чисел вернул значение вне диапазона кубика");
    }
}

ValueNode::ValueNode(std::string text, int literal)
    : field(std::move(text)), faces(std::nullopt), result(literal) {}

// Максимальный бросок выделяется восклицательными знаками
std::string ValueNode::toString() const {
    if (!faces) {
        return std::to_string(result);
    }
    std::string die = "(d" + std::to_string(*faces) + ')';
    if (result == *faces) {
        return "!*" + std::to_string(result) + "*!" + die;
    }
    return std::to_string(result) + die;
}

std::string ValueNode::toDebugString() const {
    if (faces) {
        return "ValueNode<" + std::to_string(result) + ",d" + std::to_string(*faces) + '>';
    }
    return "ValueNode<" + std::to_string(result) + '>';
}

std::string describeTree(const AstNode& root) {
    return "ParseTree<" + root.toDebugString() + '>';
}

} // namespace dice
