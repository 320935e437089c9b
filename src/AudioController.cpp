#include <QSettings>

#include "AudioController.h"
#include "logging.h"

AudioController::AudioController(QObject *parent)
    : QObject(parent), input_device_{QMediaDevices::defaultAudioInput()}
{
    restoreSelection();

    LOG_DEBUG_N << "Available audio input devices: ";
    printDevices();

    connect(&media_devices_, &QMediaDevices::audioInputsChanged,
            this, [this]{
        LOG_INFO_N << "Audio input devices changed. Now have " << media_devices_.audioInputs().size();

        // The selected device may have been unplugged
        if (getCurrentDeviceIndex() < 0) {
            input_device_ = QMediaDevices::defaultAudioInput();
            restoreSelection();
            emit currentInputDeviceChanged();
        }

        printDevices();
        emit inputDevicesChanged();
    });
}

void AudioController::setInputDevice(const QAudioDevice &dev) {
    if (dev.id() == input_device_.id()) {
        return;
    }

    input_device_ = dev;
    QSettings{}.setValue("audio/input_device", QString::fromUtf8(dev.id()));
    LOG_INFO_N << "Current audio input device changed to " << dev.description();
    emit currentInputDeviceChanged();
}

void AudioController::setInputDevice(int index)
{
    const auto devices = inputDevices();
    if (index < 0 || index >= devices.size()) {
        LOG_WARN_N << "Invalid audio input device index: " << index;
        return;
    }

    setInputDevice(devices.at(index));
}

int AudioController::getCurrentDeviceIndex() const
{
    const auto devices = inputDevices();
    for(int i = 0; i < devices.size(); ++i) {
        if (devices.at(i).id() == input_device_.id()) {
            return i;
        }
    }

    return -1;
}

void AudioController::printDevices()
{
    auto ix = 0u;
    for(const auto &dev : media_devices_.audioInputs()) {
        const bool is_current = (dev.id() == input_device_.id());
        LOG_DEBUG_N << "  #" << ix << (is_current ? " * " : " : ") << dev.description();
        ++ix;
    }
}

void AudioController::restoreSelection()
{
    const auto id = QSettings{}.value("audio/input_device").toString().toUtf8();
    if (id.isEmpty()) {
        return;
    }

    for(const auto& dev : media_devices_.audioInputs()) {
        if (dev.id() == id) {
            input_device_ = dev;
            return;
        }
    }

    LOG_DEBUG_N << "The saved audio input device is not present. Using the system default.";
}
