#pragma once

#include <cstddef>
#include <vector>

namespace StbGeom::CadKernel {

    // Flat triangle mesh of one shape.
    struct MeshBuffers
    {
        std::vector<float> vertices;   // x, y, z, x, y, z, ...
        std::vector<float> normals;    // nx, ny, nz, ... one per vertex
        std::vector<unsigned int> indices;

        void clear() {
            vertices.clear();
            normals.clear();
            indices.clear();
        }

        bool isEmpty() const {
            return vertices.empty() || indices.empty();
        }

        size_t vertexCount() const { return vertices.size() / 3; }
        size_t triangleCount() const { return indices.size() / 3; }

        // Appends other, shifting its indices past the vertices already held.
        void append(const MeshBuffers& other) {
            const unsigned int base = static_cast<unsigned int>(vertexCount());
            vertices.insert(vertices.end(), other.vertices.begin(), other.vertices.end());
            normals.insert(normals.end(), other.normals.begin(), other.normals.end());
            indices.reserve(indices.size() + other.indices.size());
            for (unsigned int index : other.indices) {
                indices.push_back(base + index);
            }
        }
    };

} // namespace StbGeom::CadKernel
