#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "acthor_types.hpp"
#include "config.hpp"
#include "device_identity.hpp"
#include "device_snapshot.hpp"
#include "imodbustransport.hpp"
#include "logging.hpp"
#include "poller.hpp"
#include "register_map.hpp"
#include "session.hpp"

namespace mypv {

/**
 * Typed access to a single AC-THOR device.
 *
 * Getters read the latest snapshot and never touch the device.
 * They throw FacadeError if there is no snapshot yet or the value
 * has no meaning for this device variant.
 * */
class Device {
    public:
        /**
         * Connects session, reads device identity and selects register map.
         * Throws ConnectError, RequestError or UnknownDeviceModel
         * */
        static std::unique_ptr<Device> connect(
            const std::shared_ptr<IModbusTransport>& transport,
            const SessionConfig& sessionConfig = SessionConfig(),
            const PollerConfig& pollerConfig = PollerConfig()
        );

        Device(
            const DeviceIdentity& identity,
            const std::shared_ptr<Session>& session,
            const std::shared_ptr<const RegisterMap>& registerMap,
            const PollerConfig& pollerConfig
        );

        const DeviceIdentity& getIdentity() const { return mIdentity; }
        const RegisterMap& getRegisterMap() const { return *mRegisterMap; }
        ConnectionState getConnectionState() const { return mSession->getState(); }

        DeviceSnapshotPtr poll() { return mPoller.pollOnce(); }
        void run(const Poller::SnapshotCallback& onSnapshot, const Poller::StateChangeCallback& onStateChange) {
            mPoller.run(onSnapshot, onStateChange);
        }
        void stop() { mPoller.stop(); }

        // throws FacadeError(NO_SNAPSHOT)
        DeviceSnapshotPtr getSnapshot() const;
        std::chrono::system_clock::time_point getSnapshotTime() const { return getSnapshot()->getTimestamp(); }
        std::chrono::steady_clock::duration getSnapshotAge() const { return getSnapshot()->getAge(); }

        /**
         * Value of any valid field from latest snapshot
         * */
        DomainValue getValue(FieldId id) const;

        // power
        int getPower() const;
        uint32_t getPower32() const;
        PowerStage getPowerStage() const;
        DevicePowers getDevicePowers() const;
        int getMaxPower() const;
        int getMaxPowerAbs() const;
        int getPowerTimeout() const;
        int getLoadNominalPower() const;
        std::vector<int> getPowerOutputs() const;
        // 32-bit register if device supports it
        int32_t getMeterPower() const;
        int getPwmOut() const;

        // temperatures, °C
        double getTemperature(int sensor) const;
        // sensors available on this device, starting from sensor 1
        std::vector<double> getTemperatures() const;
        double getChipTemperature() const;
        TemperatureRange getHotWaterRange(int unit) const;
        RoomHeatingSettings getRoomHeating(int circuit) const;
        LegionellaSettings getLegionellaSettings() const;

        // status
        StatusCode getStatus() const;
        BoostMode getBoostMode() const;
        BoostTime getBoostTime(int index) const;
        bool isBoostActive() const;
        bool isNight() const;
        bool isStratificationEnabled() const;
        bool isRelay1Active() const;
        // bit n set if load output n+1 is active
        uint32_t getLoadState() const;
        OperationMode getOperationMode() const;
        OperationState getOperationState() const;
        ControlType getControlType() const;
        bool getDeviceState() const;

        // clock
        DeviceTime getTime() const;
        UtcCorrection getUtcCorrection() const;
        bool isDstCorrectionEnabled() const;

        // electrical
        std::vector<int> getPhaseVoltages() const;
        std::vector<double> getPhaseCurrents() const;
        int getOutputVoltage() const;
        double getFrequency() const;

        // device information
        int getDeviceNumber() const;
        FirmwareVersion getControlFirmwareVersion() const;
        int getPowerStageFirmwareVersion() const;
        UpdateStatus getUpdateStatus() const;
        const std::string& getSerialNumber() const { return mIdentity.mSerialNumber; }

        /**
         * Sets power in W. Values up to 0xFFFF are written to 16-bit
         * power register, larger ones to 32-bit register pair.
         * */
        void setPower(int64_t watts);

        /**
         * Hot water temperature limits for unit 1..3, °C with 0.1 resolution.
         * Maximum is written first.
         * */
        void setHotWaterRange(int unit, double minTemp, double maxTemp);
        void setHotWaterMin(int unit, double minTemp);
        void setHotWaterMax(int unit, double maxTemp);

    private:
        static boost::log::sources::severity_logger<Log::severity> log;

        const SnapshotValue& getValid(const DeviceSnapshot& snapshot, FieldId id) const;
        double getDouble(FieldId id) const;
        int64_t getInt(FieldId id) const;
        bool getFlag(FieldId id) const;
        uint32_t getRaw(FieldId id) const;

        void writeValue(FieldId id, const DomainValue& value);
        void writeTemperature(FieldId id, double temp);
        static void checkTemperature(double temp);
        static void checkIndex(const char* what, int index, int count);

        DeviceIdentity mIdentity;
        std::shared_ptr<Session> mSession;
        std::shared_ptr<const RegisterMap> mRegisterMap;
        Poller mPoller;
};

}
