// vertex_buffer.cpp
// Vertex attribute buffers and the element index list

#include "vertex_buffer.h"

void VertexBufferStore::resizeFor(size_t count)
{
    if (vertices.size() == count) {
        return;
    }

    // A length change invalidates every attribute bound so far
    vertices.assign(count, Vertex());
}

void VertexBufferStore::setPositions(const std::vector<Vec4>& positions)
{
    resizeFor(positions.size());
    for (size_t i = 0; i < positions.size(); i++) {
        vertices[i].position = positions[i];
    }
}

void VertexBufferStore::setColors(const std::vector<LinearColor>& colors)
{
    resizeFor(colors.size());
    for (size_t i = 0; i < colors.size(); i++) {
        vertices[i].color = colors[i];
    }
}

void VertexBufferStore::setTexCoords(const std::vector<TexCoord>& texCoords)
{
    resizeFor(texCoords.size());
    for (size_t i = 0; i < texCoords.size(); i++) {
        vertices[i].texCoord = texCoords[i];
    }
}

void VertexBufferStore::setPointSizes(const std::vector<double>& pointSizes)
{
    resizeFor(pointSizes.size());
    for (size_t i = 0; i < pointSizes.size(); i++) {
        vertices[i].pointSize = pointSizes[i];
    }
}
