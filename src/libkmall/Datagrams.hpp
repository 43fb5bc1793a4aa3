/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief In-memory representation of KMALL datagrams.
 *
 * One struct per recognized datagram kind, plus OpaqueDatagram for tags that
 * are only header-decoded. Field names follow the Kongsberg EMdgm* structs.
 *
 * Byte counts that the format stores alongside a block (numBytesCmnPart,
 * numBytesPerSounding, ...) are not stored here: DatagramEncoder recomputes
 * them from the known struct size plus the block's `extra` bytes. Any bytes a
 * block carries beyond the fields we know about are kept in `extra`, and any
 * bytes between the last decoded field and the trailing length are kept in
 * `trailer`, so an encode of a decoded vendor datagram reproduces its bytes.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace kmall {

using Bytes = std::vector<uint8_t>;

// ============================================================================
// Common parts
// ============================================================================

struct DatagramHeader {
    uint32_t numBytesDgm{0};
    std::string dgmType;
    uint8_t dgmVersion{0};
    uint8_t systemID{0};
    uint16_t echoSounderID{0};
    uint32_t time_sec{0};
    uint32_t time_nanosec{0};

    /// Seconds since the epoch, nanoseconds folded in
    [[nodiscard]] double time() const;
};

/// EMdgmMpartition
struct MultibeamPartition {
    uint16_t numOfDgms{1};
    uint16_t dgmNum{1};
};

/// EMdgmMbody
struct MultibeamCommon {
    uint16_t pingCnt{0};
    uint8_t rxFansPerPing{1};
    uint8_t rxFanIndex{0};
    uint8_t swathsPerPing{1};
    uint8_t swathAlongPosition{0};
    uint8_t txTransducerInd{0};
    uint8_t rxTransducerInd{0};
    uint8_t numRxTransducers{1};
    uint8_t algorithmType{0};
    Bytes extra;
};

/// EMdgmScommon
struct SensorCommon {
    uint16_t sensorSystem{0};
    uint16_t sensorStatus{0};
    uint16_t padding{0};
    Bytes extra;
};

// ============================================================================
// I-datagrams
// ============================================================================

struct ParameterText {
    DatagramHeader header;
    uint16_t info{0};
    uint16_t status{0};
    std::string text;
    Bytes trailer;
};

/// #IIP
struct InstallationParameters : ParameterText {
};

/// #IOP
struct RuntimeParameters : ParameterText {
};

// ============================================================================
// S-datagrams
// ============================================================================

struct SvpPoint {
    float depth_m{0};
    float soundVelocity_mPerSec{0};
    uint32_t padding{0};
    float temp_C{0};
    float salinity{0};
};

/// #SVP
struct SoundVelocityProfile {
    DatagramHeader header;
    std::string sensorFormat;
    uint32_t time_sec{0};
    double latitude_deg{0};
    double longitude_deg{0};
    Bytes commonExtra;
    std::vector<SvpPoint> points;
    Bytes trailer;
};

struct SvtInfo {
    uint16_t sensorStatus{0};
    uint16_t sensorInputFormat{0};
    uint16_t sensorDataContents{0};
    float filterTime_sec{0};
    float soundVelocity_mPerSec_offset{0};
    Bytes extra;
};

struct SvtSample {
    uint32_t time_sec{0};
    uint32_t time_nanosec{0};
    float soundVelocity_mPerSec{0};
    float temp_C{0};
    float pressure_Pa{0};
    float salinity{0};
    Bytes extra;
};

/// #SVT
struct SoundVelocityTransducer {
    DatagramHeader header;
    SvtInfo info;
    std::vector<SvtSample> samples;
    Bytes trailer;
};

struct SkmInfo {
    uint8_t sensorSystem{0};
    uint8_t sensorStatus{0};
    uint16_t sensorInputFormat{0};
    uint16_t sensorDataContents{0};
    Bytes extra;
};

/// KMbinary: the attitude/position record inside each #SKM sample
struct KmBinary {
    std::string dgmType{"#KMB"};
    uint16_t numBytesDgm{120};
    uint16_t dgmVersion{0};
    uint32_t time_sec{0};
    uint32_t time_nanosec{0};
    uint32_t status{0};
    double latitude_deg{0};
    double longitude_deg{0};
    float ellipsoidHeight_m{0};
    float roll_deg{0};
    float pitch_deg{0};
    float heading_deg{0};
    float heave_m{0};
    float rollRate{0};
    float pitchRate{0};
    float yawRate{0};
    float velNorth{0};
    float velEast{0};
    float velDown{0};
    float latitudeError_m{0};
    float longitudeError_m{0};
    float ellipsoidHeightError_m{0};
    float rollError_deg{0};
    float pitchError_deg{0};
    float headingError_deg{0};
    float heaveError_m{0};
    float northAcceleration{0};
    float eastAcceleration{0};
    float downAcceleration{0};
};

struct KmDelayedHeave {
    uint32_t time_sec{0};
    uint32_t time_nanosec{0};
    float delayedHeave_m{0};
};

struct SkmSample {
    KmBinary kmBinary;
    KmDelayedHeave delayedHeave;
    Bytes extra;
};

/// #SKM
struct AttitudeDatagram {
    DatagramHeader header;
    SkmInfo info;
    std::vector<SkmSample> samples;
    Bytes trailer;
};

struct PositionData {
    DatagramHeader header;
    SensorCommon cmnPart;
    uint32_t timeFromSensor_sec{0};
    uint32_t timeFromSensor_nanosec{0};
    float posFixQuality_m{0};
    double correctedLat_deg{0};
    double correctedLong_deg{0};
    float speedOverGround_mPerSec{0};
    float courseOverGround_deg{0};
    float ellipsoidHeightReRefPoint_m{0};
    /// Raw sensor string, everything up to the trailing length
    std::string posDataFromSensor;
};

/// #SPO
struct PositionDatagram : PositionData {
};

/// #CPO
struct CompatibilityPosition : PositionData {
};

/// #SCL
struct ClockDatagram {
    DatagramHeader header;
    SensorCommon cmnPart;
    float offset_sec{0};
    int32_t clockDevPU_nanosec{0};
    std::string dataFromSensor;
};

/// #SDE
struct SensorDepthDatagram {
    DatagramHeader header;
    SensorCommon cmnPart;
    float depthUsed_m{0};
    float offset{0};
    float scale{0};
    double latitude_deg{0};
    double longitude_deg{0};
    std::string dataFromSensor;
};

/// #SHI
struct HeightDatagram {
    DatagramHeader header;
    SensorCommon cmnPart;
    uint16_t sensorType{0};
    uint16_t padding{0};
    float heightUsed_m{0};
    std::string dataFromSensor;
};

// ============================================================================
// #MRZ
// ============================================================================

struct MrzPingInfo {
    float pingRate_Hz{0};
    uint8_t beamSpacing{0};
    uint8_t depthMode{0};
    uint8_t subDepthMode{0};
    uint8_t distanceBtwSwath{0};
    uint8_t detectionMode{0};
    uint8_t pulseForm{0};
    uint16_t padding1{0};
    float frequencyMode_Hz{0};
    float freqRangeLowLim_Hz{0};
    float freqRangeHighLim_Hz{0};
    float maxTotalTxPulseLength_sec{0};
    float maxEffTxPulseLength_sec{0};
    float maxEffTxBandWidth_Hz{0};
    float absCoeff_dBPerkm{0};
    float portSectorEdge_deg{0};
    float starbSectorEdge_deg{0};
    float portMeanCov_deg{0};
    float starbMeanCov_deg{0};
    int16_t portMeanCov_m{0};
    int16_t starbMeanCov_m{0};
    uint8_t modeAndStabilisation{0};
    uint8_t runtimeFilter1{0};
    uint16_t runtimeFilter2{0};
    uint32_t pipeTrackingStatus{0};
    float transmitArraySizeUsed_deg{0};
    float receiveArraySizeUsed_deg{0};
    float transmitPower_dB{0};
    uint16_t SLrampUpTimeRemaining{0};
    uint16_t padding2{0};
    float yawAngle_deg{0};
    float headingVessel_deg{0};
    float soundSpeedAtTxDepth_mPerSec{0};
    float txTransducerDepth_m{0};
    float z_waterLevelReRefPoint_m{0};
    float x_kmallToall_m{0};
    float y_kmallToall_m{0};
    uint8_t latLongInfo{0};
    uint8_t posSensorStatus{0};
    uint8_t attitudeSensorStatus{0};
    uint8_t padding3{0};
    double latitude_deg{0};
    double longitude_deg{0};
    float ellipsoidHeightReRefPoint_m{0};
    uint16_t padding0{0};
    Bytes extra;
};

struct MrzTxSector {
    uint8_t txSectorNumb{0};
    uint8_t txArrNumber{0};
    uint8_t txSubArray{0};
    uint8_t padding0{0};
    float sectorTransmitDelay_sec{0};
    float tiltAngleReTx_deg{0};
    float txNominalSourceLevel_dB{0};
    float txFocusRange_m{0};
    float centreFreq_Hz{0};
    float signalBandWidth_Hz{0};
    float totalSignalLength_sec{0};
    uint8_t pulseShading{0};
    uint8_t signalWaveForm{0};
    uint16_t padding1{0};
    Bytes extra;
};

struct MrzRxInfo {
    uint16_t numSoundingsMaxMain{0};
    uint16_t numSoundingsValidMain{0};
    float WCSampleRate{0};
    float seabedImageSampleRate{0};
    float BSnormal_dB{0};
    float BSoblique_dB{0};
    uint16_t extraDetectionAlarmFlag{0};
    uint16_t numExtraDetections{0};
    Bytes extra;
};

struct MrzExtraDetClass {
    uint16_t numExtraDetInClass{0};
    int8_t padding{0};
    uint8_t alarmFlag{0};
    Bytes extra;
};

struct MrzSounding {
    uint16_t soundingIndex{0};
    uint8_t txSectorNumb{0};
    uint8_t detectionType{0};
    uint8_t detectionMethod{0};
    uint8_t rejectionInfo1{0};
    uint8_t rejectionInfo2{0};
    uint8_t postProcessingInfo{0};
    uint8_t detectionClass{0};
    uint8_t detectionConfidenceLevel{0};
    uint16_t padding{0};
    float rangeFactor{0};
    float qualityFactor{0};
    float detectionUncertaintyVer_m{0};
    float detectionUncertaintyHor_m{0};
    float detectionWindowLength_sec{0};
    float echoLength_sec{0};
    uint16_t WCBeamNumb{0};
    uint16_t WCrange_samples{0};
    float WCNomBeamAngleAcross_deg{0};
    float meanAbsCoeff_dBPerkm{0};
    float reflectivity1_dB{0};
    float reflectivity2_dB{0};
    float receiverSensitivityApplied_dB{0};
    float sourceLevelApplied_dB{0};
    float BScalibration_dB{0};
    float TVG_dB{0};
    float beamAngleReRx_deg{0};
    float beamAngleCorrection_deg{0};
    float twoWayTravelTime_sec{0};
    float twoWayTravelTimeCorrection_sec{0};
    float deltaLatitude_deg{0};
    float deltaLongitude_deg{0};
    float z_reRefPoint_m{0};
    float y_reRefPoint_m{0};
    float x_reRefPoint_m{0};
    float beamIncAngleAdj_deg{0};
    uint16_t realTimeCleanInfo{0};
    uint16_t SIstartRange_samples{0};
    uint16_t SIcentreSample{0};
    uint16_t SInumSamples{0};
    Bytes extra;
};

/// #MRZ
struct DepthDatagram {
    DatagramHeader header;
    MultibeamPartition partition;
    MultibeamCommon cmnPart;
    MrzPingInfo pingInfo;
    std::vector<MrzTxSector> txSectors;
    MrzRxInfo rxInfo;
    std::vector<MrzExtraDetClass> extraDetClasses;
    std::vector<MrzSounding> soundings;
    /// Seabed image samples of all soundings, 0.1 dB steps
    std::vector<int16_t> SIsample_desidB;
    Bytes trailer;

    /**
     * Start index into SIsample_desidB for each sounding, plus one final
     * element equal to the total sample count.
     */
    [[nodiscard]] std::vector<size_t> seabedImageOffsets() const;

    /// Seabed image samples of one sounding
    [[nodiscard]] std::vector<int16_t> seabedImage(size_t soundingIndex) const;
};

// ============================================================================
// #MWC
// ============================================================================

struct MwcTxInfo {
    int16_t padding{0};
    float heave_m{0};
    Bytes extra;
};

struct MwcTxSector {
    float tiltAngleReTx_deg{0};
    float centreFreq_Hz{0};
    float txBeamWidthAlong_deg{0};
    uint16_t txSectorNum{0};
    int16_t padding{0};
    Bytes extra;
};

struct MwcRxInfo {
    uint8_t phaseFlag{0};
    uint8_t TVGfunctionApplied{0};
    int8_t TVGoffset_dB{0};
    float sampleFreq_Hz{0};
    float soundVelocity_mPerSec{0};
    Bytes extra;
};

struct MwcBeam {
    float beamPointAngReVertical_deg{0};
    uint16_t startRangeSampleNum{0};
    uint16_t detectedRangeInSamples{0};
    uint16_t beamTxSectorNum{0};
    Bytes extra;
    std::vector<int8_t> sampleAmplitude05dB;
    /// Present when phaseFlag is MWC_PHASE_LOW_RES
    std::vector<int8_t> rxBeamPhase8;
    /// Present when phaseFlag is MWC_PHASE_HIGH_RES
    std::vector<int16_t> rxBeamPhase16;
};

/// #MWC
struct WaterColumnDatagram {
    DatagramHeader header;
    MultibeamPartition partition;
    MultibeamCommon cmnPart;
    MwcTxInfo txInfo;
    std::vector<MwcTxSector> txSectors;
    MwcRxInfo rxInfo;
    std::vector<MwcBeam> beams;
    Bytes trailer;
};

// ============================================================================
// #CHE
// ============================================================================

/// Heave at the transducer, sent ahead of #MWC in compatibility mode
struct CompatibilityHeaveDatagram {
    DatagramHeader header;
    MultibeamCommon cmnPart;
    float heave_m{0};
    Bytes trailer;
};

// ============================================================================
// Synthetic and opaque
// ============================================================================

/**
 * #QZ0 / #QZ1. The payload is held dequantized; QuantizedDatagram converts
 * it to and from fixed point at the file boundary.
 */
struct CompressedDatagram {
    DatagramHeader header;
    uint8_t level{0};
    uint8_t codecVersion{0};
    std::string originalTag;
    std::variant<DepthDatagram, WaterColumnDatagram> payload;
};

/// Header-only decode: BIST replies, raw sensor datagrams and unknown tags
struct OpaqueDatagram {
    DatagramHeader header;
    Bytes body;
};

using Datagram = std::variant<OpaqueDatagram, InstallationParameters, RuntimeParameters, SoundVelocityProfile,
                              SoundVelocityTransducer, AttitudeDatagram, PositionDatagram, CompatibilityPosition,
                              ClockDatagram, SensorDepthDatagram, HeightDatagram, DepthDatagram,
                              WaterColumnDatagram, CompatibilityHeaveDatagram, CompressedDatagram>;

[[nodiscard]] const DatagramHeader &headerOf(const Datagram &datagram);
[[nodiscard]] DatagramHeader &headerOf(Datagram &datagram);

} // namespace kmall
