// vertex_buffer.h
// Vertex attribute buffers and the element index list

#ifndef RASTER_VERTEX_BUFFER_H
#define RASTER_VERTEX_BUFFER_H

#include "vertex.h"
#include <cstddef>
#include <vector>

// =============================================================================
// Vertex Buffer Store
// =============================================================================
//
// Four independent attribute buffers (position, color, texture coordinate,
// point size) merged per index into one vertex array.
//
// Binding a buffer whose length differs from the current vertex count
// reallocates the whole vertex array and resets every component to its
// default before the new attribute is written. Attributes bound earlier are
// lost in that case and must be bound again.
//
// The element index list has its own lifecycle and is never touched by the
// attribute binds.
//
// =============================================================================

class VertexBufferStore {
public:
    VertexBufferStore() = default;

    // Attribute binds. Each entry is a full attribute value; callers pad
    // short tuples with the attribute's defaults.
    void setPositions(const std::vector<Vec4>& positions);
    void setColors(const std::vector<LinearColor>& colors);
    void setTexCoords(const std::vector<TexCoord>& texCoords);
    void setPointSizes(const std::vector<double>& pointSizes);

    // Replace the element index list
    void setElements(const std::vector<int>& elements) { elementList = elements; }

    // Number of vertices in the merged array
    size_t getVertexCount() const { return vertices.size(); }

    // Check that an index addresses a vertex
    bool hasVertex(int index) const {
        return index >= 0 && static_cast<size_t>(index) < vertices.size();
    }

    // Vertex at an index (caller checks hasVertex first)
    const Vertex& getVertex(int index) const { return vertices[static_cast<size_t>(index)]; }

    const std::vector<int>& getElements() const { return elementList; }

private:
    // Reinitialize to defaults when the bound length differs
    void resizeFor(size_t count);

    std::vector<Vertex> vertices;
    std::vector<int> elementList;
};

#endif // RASTER_VERTEX_BUFFER_H
