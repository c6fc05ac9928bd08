#pragma once

// Include after util/logger.hpp: wingdi.h defines ERROR.
#include "../capture_platform.hpp"

#include <d3d11_4.h>
#include <winrt/base.h>
#include <winrt/Windows.Graphics.DirectX.Direct3D11.h>

namespace pixel_forge {

// D3D11 device + immediate context and its WinRT wrapper used by the frame pool
class WgcDevice : public GraphicsDevice {
public:
    WgcDevice(winrt::com_ptr<ID3D11Device> device,
              winrt::com_ptr<ID3D11DeviceContext> context,
              winrt::Windows::Graphics::DirectX::Direct3D11::IDirect3DDevice capture_device)
        : m_device(std::move(device))
        , m_context(std::move(context))
        , m_capture_device(std::move(capture_device)) {}

    ID3D11Device* get_device() const { return m_device.get(); }
    ID3D11DeviceContext* get_context() const { return m_context.get(); }

    const winrt::Windows::Graphics::DirectX::Direct3D11::IDirect3DDevice& get_capture_device() const {
        return m_capture_device;
    }

private:
    winrt::com_ptr<ID3D11Device> m_device;
    winrt::com_ptr<ID3D11DeviceContext> m_context;
    winrt::Windows::Graphics::DirectX::Direct3D11::IDirect3DDevice m_capture_device{nullptr};
};

// Hardware device with BGRA support. Levels 11_1 down to 9_1 are offered;
// anything below 11_1 is FEATURE_LEVEL_NOT_SATISFIED.
CaptureStatus create_d3d_device(winrt::com_ptr<ID3D11Device>& device,
                                winrt::com_ptr<ID3D11DeviceContext>& context);

// DXGI device -> IDirect3DDevice for Direct3D11CaptureFramePool
CaptureStatus wrap_device_for_capture(
    ID3D11Device* device,
    winrt::Windows::Graphics::DirectX::Direct3D11::IDirect3DDevice& capture_device);

// Underlying D3D11 texture of a capture surface
winrt::com_ptr<ID3D11Texture2D> get_surface_texture(
    const winrt::Windows::Graphics::DirectX::Direct3D11::IDirect3DSurface& surface);

}  // namespace pixel_forge
