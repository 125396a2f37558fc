#pragma once

#include <cstdint>

#include <SDL3/SDL.h>

class AudioSink;

/*
 * Owns the playback device stream. The sink's callback is bound to the
 * stream, so the audio thread exists exactly as long as this object holds
 * the stream open.
 */
class AudioSystem {
private:
    SDL_AudioStream *stream = nullptr;
    float gain = 1.0f;

public:
    AudioSystem();
    ~AudioSystem();

    /* opens the default playback device as F32 stereo at the sink's rate. */
    bool open(AudioSink *sink);
    void close();

    void resume();

    void set_volume(uint16_t volume);
};
