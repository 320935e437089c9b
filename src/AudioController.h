#pragma once

#include <QMediaDevices>
#include <QAudioDevice>

/*! Keeps track of the available microphones, and which one to use.
 *
 *  The selection is stored in the "audio/input_device" setting by device id.
 */
class AudioController : public QObject
{
    Q_OBJECT

public:
    explicit AudioController(QObject *parent = nullptr);

    const QList<QAudioDevice> inputDevices() const { return media_devices_.audioInputs(); }
    const QAudioDevice &currentInputDevice() const { return input_device_; }

    void setInputDevice(const QAudioDevice &dev);
    void setInputDevice(int index);
    int getCurrentDeviceIndex() const;

signals:
    void inputDevicesChanged();
    void currentInputDeviceChanged();

private:
    void printDevices();
    void restoreSelection();

    QMediaDevices media_devices_;
    QAudioDevice  input_device_;
};
