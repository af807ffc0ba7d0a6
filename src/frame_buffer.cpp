// frame_buffer.cpp
// Per-sample fragment lists for deferred compositing

#include "frame_buffer.h"
#include <SDL.h>

FrameBuffer::FrameBuffer()
    : width(0)
    , height(0)
    , fsaa(1)
    , fragmentCount(0)
{
}

bool FrameBuffer::configure(int w, int h, int level)
{
    if (isAllocated()) {
        if (w != width || h != height || level != fsaa) {
            SDL_LogWarn(SDL_LOG_CATEGORY_RENDER,
                        "Frame buffer already allocated at %dx%d fsaa %d; ignoring %dx%d fsaa %d",
                        width, height, fsaa, w, h, level);
            return false;
        }
        return true;
    }

    width = w;
    height = h;
    fsaa = level;
    return true;
}

void FrameBuffer::allocate()
{
    size_t count = static_cast<size_t>(getSampleWidth()) * getSampleHeight();
    samples.assign(count, std::vector<Vertex>());

    SDL_LogDebug(SDL_LOG_CATEGORY_RENDER, "Allocated %dx%d sample grid",
                 getSampleWidth(), getSampleHeight());
}

bool FrameBuffer::addFragment(int sx, int sy, const Vertex& fragment)
{
    // Samples outside the viewport are dropped silently
    if (!inBounds(sx, sy)) {
        return false;
    }

    if (!isAllocated()) {
        allocate();
    }

    samples[static_cast<size_t>(sy) * getSampleWidth() + sx].push_back(fragment);
    fragmentCount++;
    return true;
}

const std::vector<Vertex>& FrameBuffer::getFragments(int sx, int sy) const
{
    static const std::vector<Vertex> empty;

    if (!isAllocated() || !inBounds(sx, sy)) {
        return empty;
    }
    return samples[static_cast<size_t>(sy) * getSampleWidth() + sx];
}
