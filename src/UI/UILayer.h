#pragma once

#include "Core/Layer.h"

namespace UI
{

/// Owns the ImGui context. onRender() opens the frame for the layers pushed after
/// it and onPostRender() submits the draw data, so it must be pushed first.
class UILayer : public Core::Layer
{
  public:
    UILayer();
    ~UILayer() override = default;

    void onAttach() override;
    void onDetach() override;
    void onRender() override;
    void onPostRender() override;

  private:
    /// Sizes the built-in font and style metrics for the window's content scale.
    void applyContentScale();

    float m_ContentScale = 1.0F;
};

} // namespace UI
