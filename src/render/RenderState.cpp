#include "render/RenderState.hpp"

#include "render/RenderErrors.hpp"

RenderStateStack::RenderStateStack() : m_stack_(1) {}

void RenderStateStack::Multiply(const Matrix3& matrix)
{
    Top().matrix.MultiplySelf(matrix);
}

void RenderStateStack::Push()
{
    m_stack_.push_back(Top());
}

void RenderStateStack::Pop()
{
    if (m_stack_.size() <= 1) {
        throw InvalidStateError("RenderStateStack: cannot pop the base state");
    }
    m_stack_.pop_back();
}

void RenderStateStack::Truncate(size_t depth) noexcept
{
    while (m_stack_.size() > 1 && m_stack_.size() > depth) {
        m_stack_.pop_back();
    }
}
