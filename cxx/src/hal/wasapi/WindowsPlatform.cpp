/**
 * @file WindowsPlatform.cpp
 * @brief Implementation of the WASAPI platform boundary on top of COM.
 */

#include "WindowsPlatform.hpp"

#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#include <mmdeviceapi.h>
#include <audioclient.h>
#include <mmreg.h>
#include <ks.h>
#include <ksmedia.h>
#include <wrl/client.h>

#include <string>

using Microsoft::WRL::ComPtr;

namespace hal::wasapi {

namespace {

DriverError hresult_error(const char* call, HRESULT hr) {
    return make_error(static_cast<int32_t>(hr), std::string("WASAPI: ") + call + " failed");
}

DriverError last_win32_error(const char* call) {
    return hresult_error(call, HRESULT_FROM_WIN32(GetLastError()));
}

WAVEFORMATEXTENSIBLE to_waveformat(const MixFormat& format) {
    WAVEFORMATEXTENSIBLE wfx{};
    wfx.Format.wFormatTag = WAVE_FORMAT_EXTENSIBLE;
    wfx.Format.nChannels = format.channels;
    wfx.Format.nSamplesPerSec = format.sample_rate;
    wfx.Format.nAvgBytesPerSec = format.avg_bytes_per_sec;
    wfx.Format.nBlockAlign = format.block_align;
    wfx.Format.wBitsPerSample = format.bits_per_sample;
    wfx.Format.cbSize = sizeof(WAVEFORMATEXTENSIBLE) - sizeof(WAVEFORMATEX);
    wfx.Samples.wValidBitsPerSample = format.valid_bits_per_sample;
    wfx.dwChannelMask = format.channel_mask;
    wfx.SubFormat = KSDATAFORMAT_SUBTYPE_IEEE_FLOAT;
    return wfx;
}

AUDIO_STREAM_CATEGORY to_audio_category(StreamCategory category) {
    switch (category) {
        case StreamCategory::Media:          return AudioCategory_Media;
        case StreamCategory::Communications: return AudioCategory_Communications;
        case StreamCategory::GameMedia:      return AudioCategory_GameMedia;
        case StreamCategory::Other:          break;
    }
    return AudioCategory_Other;
}

class WindowsEvent : public ReadinessEvent {
public:
    explicit WindowsEvent(HANDLE handle) : handle_(handle) {}
    ~WindowsEvent() override { CloseHandle(handle_); }

    Status wait(uint32_t& wake_code) override {
        DWORD result = WaitForSingleObject(handle_, INFINITE);
        if (result == WAIT_FAILED) {
            return last_win32_error("WaitForSingleObject");
        }
        wake_code = static_cast<uint32_t>(result - WAIT_OBJECT_0);
        return std::nullopt;
    }

    Status signal() override {
        if (!SetEvent(handle_)) {
            return last_win32_error("SetEvent");
        }
        return std::nullopt;
    }

    void* native_handle() override { return handle_; }

private:
    HANDLE handle_;
};

class WindowsAudioClient : public AudioClient {
public:
    explicit WindowsAudioClient(ComPtr<IAudioClient2> client) : client_(std::move(client)) {}

    Status set_properties(const ClientProperties& properties) override {
        AudioClientProperties props{};
        props.cbSize = sizeof(AudioClientProperties);
        props.bIsOffload = properties.offload ? TRUE : FALSE;
        props.eCategory = to_audio_category(properties.category);
        HRESULT hr = client_->SetClientProperties(&props);
        if (FAILED(hr)) return hresult_error("IAudioClient2::SetClientProperties", hr);
        return std::nullopt;
    }

    Status check_format(const MixFormat& format, bool& exact) override {
        WAVEFORMATEXTENSIBLE wfx = to_waveformat(format);
        WAVEFORMATEX* closest = nullptr;
        HRESULT hr = client_->IsFormatSupported(AUDCLNT_SHAREMODE_SHARED, &wfx.Format, &closest);
        if (closest) {
            CoTaskMemFree(closest);
        }
        if (FAILED(hr)) return hresult_error("IAudioClient::IsFormatSupported", hr);
        exact = (hr == S_OK);
        return std::nullopt;
    }

    Status initialize(const MixFormat& format) override {
        format_ = to_waveformat(format);
        HRESULT hr = client_->Initialize(AUDCLNT_SHAREMODE_SHARED,
                                         AUDCLNT_STREAMFLAGS_EVENTCALLBACK | AUDCLNT_STREAMFLAGS_NOPERSIST,
                                         0, 0, &format_.Format, nullptr);
        if (FAILED(hr)) return hresult_error("IAudioClient::Initialize", hr);
        return std::nullopt;
    }

    Status buffer_size(uint32_t& frames) override {
        UINT32 size = 0;
        HRESULT hr = client_->GetBufferSize(&size);
        if (FAILED(hr)) return hresult_error("IAudioClient::GetBufferSize", hr);
        frames = size;
        return std::nullopt;
    }

    Status open_render_service() override {
        HRESULT hr = client_->GetService(__uuidof(IAudioRenderClient),
                                         reinterpret_cast<void**>(render_.ReleaseAndGetAddressOf()));
        if (FAILED(hr)) return hresult_error("IAudioClient::GetService(IAudioRenderClient)", hr);
        return std::nullopt;
    }

    Status set_event(ReadinessEvent& event) override {
        HRESULT hr = client_->SetEventHandle(static_cast<HANDLE>(event.native_handle()));
        if (FAILED(hr)) return hresult_error("IAudioClient::SetEventHandle", hr);
        return std::nullopt;
    }

    Status start() override {
        HRESULT hr = client_->Start();
        if (FAILED(hr)) return hresult_error("IAudioClient::Start", hr);
        return std::nullopt;
    }

    Status stop() override {
        HRESULT hr = client_->Stop();
        if (FAILED(hr)) return hresult_error("IAudioClient::Stop", hr);
        return std::nullopt;
    }

    Status current_padding(uint32_t& frames) override {
        UINT32 padding = 0;
        HRESULT hr = client_->GetCurrentPadding(&padding);
        if (FAILED(hr)) return hresult_error("IAudioClient::GetCurrentPadding", hr);
        frames = padding;
        return std::nullopt;
    }

    Status get_buffer(uint32_t frames, float*& data) override {
        if (!render_) {
            return make_error(error_code::kNotInitialized, "WASAPI: render service not open");
        }
        BYTE* buffer = nullptr;
        HRESULT hr = render_->GetBuffer(frames, &buffer);
        if (FAILED(hr)) return hresult_error("IAudioRenderClient::GetBuffer", hr);
        data = reinterpret_cast<float*>(buffer);
        return std::nullopt;
    }

    Status release_buffer(uint32_t frames) override {
        HRESULT hr = render_->ReleaseBuffer(frames, 0);
        if (FAILED(hr)) return hresult_error("IAudioRenderClient::ReleaseBuffer", hr);
        return std::nullopt;
    }

private:
    ComPtr<IAudioClient2> client_;
    ComPtr<IAudioRenderClient> render_;
    WAVEFORMATEXTENSIBLE format_{};
};

class WindowsEndpoint : public Endpoint {
public:
    explicit WindowsEndpoint(ComPtr<IMMDevice> device) : device_(std::move(device)) {}

    Status activate(std::unique_ptr<AudioClient>& client) override {
        ComPtr<IAudioClient2> audio_client;
        HRESULT hr = device_->Activate(__uuidof(IAudioClient2), CLSCTX_ALL, nullptr,
                                       reinterpret_cast<void**>(audio_client.GetAddressOf()));
        if (FAILED(hr)) return hresult_error("IMMDevice::Activate(IAudioClient2)", hr);
        client = std::make_unique<WindowsAudioClient>(std::move(audio_client));
        return std::nullopt;
    }

private:
    ComPtr<IMMDevice> device_;
};

} // namespace

Status WindowsPlatform::enter_apartment() {
    HRESULT hr = CoInitializeEx(nullptr, COINIT_MULTITHREADED);
    if (FAILED(hr)) return hresult_error("CoInitializeEx", hr);
    return std::nullopt;
}

void WindowsPlatform::leave_apartment() {
    CoUninitialize();
}

Status WindowsPlatform::default_render_endpoint(std::unique_ptr<Endpoint>& endpoint) {
    ComPtr<IMMDeviceEnumerator> enumerator;
    HRESULT hr = CoCreateInstance(__uuidof(MMDeviceEnumerator), nullptr, CLSCTX_ALL,
                                  __uuidof(IMMDeviceEnumerator),
                                  reinterpret_cast<void**>(enumerator.GetAddressOf()));
    if (FAILED(hr)) return hresult_error("CoCreateInstance(MMDeviceEnumerator)", hr);

    ComPtr<IMMDevice> device;
    hr = enumerator->GetDefaultAudioEndpoint(eRender, eConsole, device.GetAddressOf());
    if (FAILED(hr)) return hresult_error("IMMDeviceEnumerator::GetDefaultAudioEndpoint", hr);

    endpoint = std::make_unique<WindowsEndpoint>(std::move(device));
    return std::nullopt;
}

Status WindowsPlatform::create_readiness_event(std::unique_ptr<ReadinessEvent>& event) {
    HANDLE handle = CreateEventExW(nullptr, nullptr, 0, EVENT_ALL_ACCESS);
    if (!handle) return last_win32_error("CreateEventEx");
    event = std::make_unique<WindowsEvent>(handle);
    return std::nullopt;
}

} // namespace hal::wasapi
