#pragma once

#include "Mesh.hpp"

// 基础几何体生成
namespace prim {

Mesh makeUnitQuad(); // [0,1]x[0,1] 平面（界面按钮）

} // namespace prim
