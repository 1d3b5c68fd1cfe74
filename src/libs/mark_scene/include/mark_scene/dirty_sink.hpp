#pragma once

namespace mark_scene {

class DirtySink {
public:
    virtual ~DirtySink() = default;
    virtual void mark_dirty() = 0;
};

} // namespace mark_scene
