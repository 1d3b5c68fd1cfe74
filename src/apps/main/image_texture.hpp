#pragma once

#include <mark_model/types.hpp>
#include <optional>
#include <string>

// OpenGL texture holding a decoded floor-plan image. Owns the GL name.
class ImageTexture {
public:
    ImageTexture() = default;
    ~ImageTexture();

    ImageTexture(const ImageTexture&) = delete;
    ImageTexture& operator=(const ImageTexture&) = delete;

    // Replaces the current texture. Returns false when the file cannot be decoded.
    bool load(const std::string& path);
    void release();

    bool valid() const { return texture_ != 0; }
    unsigned int gl_name() const { return texture_; }
    mark_model::Size size() const { return {(double)width_, (double)height_}; }

private:
    unsigned int texture_ = 0;
    int width_ = 0;
    int height_ = 0;
};
