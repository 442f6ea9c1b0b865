#pragma once

#include <cstddef>
#include <vector>

#include <blend2d.h>

#include "utils/ColorUtils.hpp"
#include "utils/Matrix3.hpp"

struct RenderState {
    Matrix3 matrix;
    BLRgba32 fill = color_utils::kBlack;
    BLRgba32 stroke = color_utils::kBlack;
    double stroke_width = 0.0;
};

// Save/restore stack of render states. Frames are values, so changing the top
// never affects a saved frame.
class RenderStateStack
{
public:
    RenderStateStack();

    [[nodiscard]] const RenderState& Top() const { return m_stack_.back(); }
    RenderState& Top() { return m_stack_.back(); }

    [[nodiscard]] const Matrix3& GetMatrix() const { return Top().matrix; }
    void SetMatrix(const Matrix3& matrix) { Top().matrix = matrix; }

    [[nodiscard]] BLRgba32 GetFill() const { return Top().fill; }
    void SetFill(BLRgba32 color) { Top().fill = color; }

    [[nodiscard]] BLRgba32 GetStroke() const { return Top().stroke; }
    void SetStroke(BLRgba32 color) { Top().stroke = color; }

    [[nodiscard]] double GetStrokeWidth() const { return Top().stroke_width; }
    void SetStrokeWidth(double width) { Top().stroke_width = width; }

    // Composes 'matrix' into the top frame; it is applied before the existing transform.
    void Multiply(const Matrix3& matrix);

    void Push();
    // Throws InvalidStateError when only the base frame is left.
    void Pop();
    // Drops frames above 'depth'; the base frame always stays.
    void Truncate(size_t depth) noexcept;

    [[nodiscard]] size_t Depth() const { return m_stack_.size(); }

private:
    std::vector<RenderState> m_stack_;
};

// Pushes a frame for the lifetime of the scope and drops it again on exit,
// including any frames left pushed when an exception unwinds through.
class ScopedRenderState
{
public:
    explicit ScopedRenderState(RenderStateStack& stack) : m_stack_(stack), m_depth_(stack.Depth()) { m_stack_.Push(); }
    ~ScopedRenderState() { m_stack_.Truncate(m_depth_); }

    ScopedRenderState(const ScopedRenderState&) = delete;
    ScopedRenderState& operator=(const ScopedRenderState&) = delete;
    ScopedRenderState(ScopedRenderState&&) = delete;
    ScopedRenderState& operator=(ScopedRenderState&&) = delete;

private:
    RenderStateStack& m_stack_;
    size_t m_depth_;
};
