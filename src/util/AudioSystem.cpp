#include <cstdio>
#include <SDL3/SDL.h>

#include "AudioSystem.hpp"
#include "audio/AudioSink.hpp"

AudioSystem::AudioSystem() {
}

AudioSystem::~AudioSystem() {
    close();
}

bool AudioSystem::open(AudioSink *sink) {
    if (!SDL_InitSubSystem(SDL_INIT_AUDIO)) {
        SDL_Log("Couldn't initialize SDL audio: %s", SDL_GetError());
        return false;
    }

    // for info purposes, print out the available devices and their formats.
    int num_devices = 0;
    SDL_AudioDeviceID *devices = SDL_GetAudioPlaybackDevices(&num_devices);
    if (devices) {
        for (int i = 0; i < num_devices; i++) {
            SDL_AudioSpec spec;
            if (SDL_GetAudioDeviceFormat(devices[i], &spec, NULL)) {
                printf("AudioDevice %d: %s %d Hz %d ch\n", i, SDL_GetAudioDeviceName(devices[i]), spec.freq, spec.channels);
            }
        }
        SDL_free(devices);
    }
    if (num_devices == 0) {
        SDL_Log("No audio playback devices available");
        return false;
    }

    SDL_AudioSpec spec = {
        SDL_AUDIO_F32,
        AUDIO_CHANNELS,
        sink->get_sample_rate()
    };
    /* SDL converts from our spec to whatever the hardware runs at. */
    stream = SDL_OpenAudioDeviceStream(SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK, &spec, AudioSink::stream_callback, sink);
    if (!stream) {
        SDL_Log("Couldn't open audio device stream: %s", SDL_GetError());
        return false;
    }

    SDL_AudioSpec src_spec, dst_spec;
    if (SDL_GetAudioStreamFormat(stream, &src_spec, &dst_spec)) {
        printf("Audio stream: %d Hz %d ch -> device %d Hz %d ch\n", src_spec.freq, src_spec.channels, dst_spec.freq, dst_spec.channels);
    }

    // streams opened this way start paused.
    resume();
    return true;
}

void AudioSystem::close() {
    if (stream) {
        // stops the callback before we let go of the sink.
        SDL_DestroyAudioStream(stream);
        stream = nullptr;
    }
}

void AudioSystem::resume() {
    if (stream) SDL_ResumeAudioStreamDevice(stream);
}

void AudioSystem::set_volume(uint16_t volume) {
    if (volume > 15) volume = 15;
    gain = (float)volume / 15.0f;
    if (stream) {
        SDL_SetAudioStreamGain(stream, gain);
    }
}
