#include "Primitives.hpp"

#include <glm/glm.hpp>

#include <vector>

namespace prim {

Mesh makeUnitQuad() {
    const glm::vec3 n(0.0f, 0.0f, 1.0f);
    std::vector<VertexPN> v = {
        {{0.0f, 0.0f, 0.0f}, n, {0.0f, 0.0f}},
        {{1.0f, 0.0f, 0.0f}, n, {1.0f, 0.0f}},
        {{1.0f, 1.0f, 0.0f}, n, {1.0f, 1.0f}},
        {{0.0f, 1.0f, 0.0f}, n, {0.0f, 1.0f}},
    };
    std::vector<unsigned int> idx = {0, 1, 2, 0, 2, 3};
    return Mesh::fromTriangles(v, idx);
}

} // namespace prim
