#include "../../util/logger.hpp"
#include "d3d_device.hpp"

#include <dxgi.h>
#include <inspectable.h>
#include <windows.graphics.directx.direct3d11.interop.h>

namespace pixel_forge {

using winrt::Windows::Graphics::DirectX::Direct3D11::IDirect3DDevice;
using winrt::Windows::Graphics::DirectX::Direct3D11::IDirect3DSurface;

CaptureStatus create_d3d_device(winrt::com_ptr<ID3D11Device>& device,
                                winrt::com_ptr<ID3D11DeviceContext>& context) {
    static const D3D_FEATURE_LEVEL feature_levels[] = {
        D3D_FEATURE_LEVEL_11_1,
        D3D_FEATURE_LEVEL_11_0,
        D3D_FEATURE_LEVEL_10_1,
        D3D_FEATURE_LEVEL_10_0,
        D3D_FEATURE_LEVEL_9_3,
        D3D_FEATURE_LEVEL_9_2,
        D3D_FEATURE_LEVEL_9_1,
    };

    D3D_FEATURE_LEVEL obtained{};
    HRESULT hr = D3D11CreateDevice(
        nullptr,
        D3D_DRIVER_TYPE_HARDWARE,
        nullptr,
        D3D11_CREATE_DEVICE_BGRA_SUPPORT,
        feature_levels,
        ARRAYSIZE(feature_levels),
        D3D11_SDK_VERSION,
        device.put(),
        &obtained,
        context.put()
    );

    if (FAILED(hr)) {
        LOG_ERROR("D3D11CreateDevice failed: 0x%08lX", static_cast<unsigned long>(hr));
        return CaptureStatus::DEVICE_CREATION_FAILED;
    }

    if (obtained != D3D_FEATURE_LEVEL_11_1) {
        LOG_ERROR("Direct3D feature level 11_1 required, device offers 0x%x",
                  static_cast<unsigned>(obtained));
        device = nullptr;
        context = nullptr;
        return CaptureStatus::FEATURE_LEVEL_NOT_SATISFIED;
    }

    // The capture thread copies into textures the consumer thread maps
    auto multithread = device.try_as<ID3D11Multithread>();
    if (multithread) {
        multithread->SetMultithreadProtected(TRUE);
    } else {
        LOG_WARN("ID3D11Multithread not available, readback is not serialized");
    }

    LOG_DEBUG("Created D3D11 device (feature level 11_1)");
    return CaptureStatus::OK;
}

CaptureStatus wrap_device_for_capture(ID3D11Device* device, IDirect3DDevice& capture_device) {
    winrt::com_ptr<IDXGIDevice> dxgi_device;
    HRESULT hr = device->QueryInterface(IID_PPV_ARGS(dxgi_device.put()));
    if (FAILED(hr)) {
        LOG_ERROR("Device has no IDXGIDevice: 0x%08lX", static_cast<unsigned long>(hr));
        return CaptureStatus::DEVICE_CREATION_FAILED;
    }

    winrt::com_ptr<::IInspectable> inspectable;
    hr = CreateDirect3D11DeviceFromDXGIDevice(dxgi_device.get(), inspectable.put());
    if (FAILED(hr)) {
        LOG_ERROR("CreateDirect3D11DeviceFromDXGIDevice failed: 0x%08lX",
                  static_cast<unsigned long>(hr));
        return CaptureStatus::DEVICE_CREATION_FAILED;
    }

    capture_device = inspectable.as<IDirect3DDevice>();
    return CaptureStatus::OK;
}

winrt::com_ptr<ID3D11Texture2D> get_surface_texture(const IDirect3DSurface& surface) {
    auto access = surface.as<::Windows::Graphics::DirectX::Direct3D11::IDirect3DDxgiInterfaceAccess>();
    winrt::com_ptr<ID3D11Texture2D> texture;
    winrt::check_hresult(access->GetInterface(__uuidof(ID3D11Texture2D), texture.put_void()));
    return texture;
}

}  // namespace pixel_forge
