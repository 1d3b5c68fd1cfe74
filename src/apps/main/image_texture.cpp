#define STB_IMAGE_IMPLEMENTATION
#include "image_texture.hpp"
#include <mark_scene/editor_log.hpp>
#include <SDL3/SDL_opengl.h>
#include <stb_image.h>

ImageTexture::~ImageTexture() {
    release();
}

void ImageTexture::release() {
    if (texture_ != 0) {
        GLuint name = texture_;
        glDeleteTextures(1, &name);
    }
    texture_ = 0;
    width_ = 0;
    height_ = 0;
}

bool ImageTexture::load(const std::string& path) {
    release();

    int w = 0, h = 0, channels = 0;
    unsigned char* pixels = stbi_load(path.c_str(), &w, &h, &channels, 4);
    if (!pixels) {
        mark_scene::editor_logger()->error("image_load failed path={} reason={}", path,
            stbi_failure_reason() ? stbi_failure_reason() : "unknown");
        return false;
    }

    GLuint name = 0;
    glGenTextures(1, &name);
    glBindTexture(GL_TEXTURE_2D, name);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, w, h, 0, GL_RGBA, GL_UNSIGNED_BYTE, pixels);
    stbi_image_free(pixels);

    texture_ = name;
    width_ = w;
    height_ = h;
    mark_scene::editor_logger()->info("image_load ok path={} size={}x{}", path, w, h);
    return true;
}
