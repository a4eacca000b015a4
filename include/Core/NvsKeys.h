#pragma once
/**
 * @file NvsKeys.h
 * @brief Centralized NVS key constants used by ConfigStore-registered variables.
 */

namespace NvsKeys {

/** @brief Preferences namespace opened at boot (`main.cpp`). */
constexpr char StorageNamespace[] = "irrigo"; // Preferences namespace name used at boot to open the firmware NVS partition.
/** @brief Config schema version key read/written by `ConfigStore::runMigrations`. */
constexpr char ConfigVersion[] = "cfg_ver"; // Persistent schema-version marker used to select and run config migrations.

namespace Wifi {
constexpr char Enabled[] = "wifi_en"; // WiFi module persisted key for field `wifi_en`.
constexpr char Ssid[] = "wifi_ssid"; // WiFi module persisted key for field `wifi_ssid`.
constexpr char Pass[] = "wifi_pass"; // WiFi module persisted key for field `wifi_pass`.
constexpr char Mdns[] = "wifi_mdns"; // WiFi module persisted key for field `mdns`.
}  // namespace Wifi

namespace Mqtt {
constexpr char Host[] = "mq_host"; // MQTT module persisted key for field `mq_host`.
constexpr char Port[] = "mq_port"; // MQTT module persisted key for field `mq_port`.
constexpr char User[] = "mq_user"; // MQTT module persisted key for field `mq_user`.
constexpr char Pass[] = "mq_pass"; // MQTT module persisted key for field `mq_pass`.
constexpr char BaseTopic[] = "mq_base"; // MQTT module persisted key for field `mq_base`.
constexpr char Enabled[] = "mq_en"; // MQTT module persisted key for field `mq_en`.
constexpr char SensorMinPublishMs[] = "mq_smin"; // MQTT module persisted key for field `mq_smin`.
}  // namespace Mqtt

namespace Ha {
constexpr char Enabled[] = "ha_en"; // Home Assistant module persisted key for field `ha_en`.
constexpr char Vendor[] = "ha_vend"; // Home Assistant module persisted key for field `ha_vend`.
constexpr char DeviceId[] = "ha_devid"; // Home Assistant module persisted key for field `ha_devid`.
constexpr char DiscoveryPrefix[] = "ha_pref"; // Home Assistant module persisted key for field `ha_pref`.
constexpr char Model[] = "ha_model"; // Home Assistant module persisted key for field `ha_model`.
}  // namespace Ha

namespace Time {
constexpr char Server1[] = "ntp_s1"; // Time module persisted key for field `ntp_s1`.
constexpr char Server2[] = "ntp_s2"; // Time module persisted key for field `ntp_s2`.
constexpr char Tz[] = "ntp_tz"; // Time module persisted key for field `ntp_tz`.
constexpr char Enabled[] = "ntp_en"; // Time module persisted key for field `ntp_en`.
}  // namespace Time

namespace Log {
constexpr char MinLevel[] = "log_lvl"; // Log hub module persisted key for field `min_level`.
}  // namespace Log

namespace Weather {
constexpr char Enabled[] = "wx_en"; // Weather module persisted key for field `enabled`.
constexpr char MinSpacingS[] = "wx_spc"; // Weather module persisted key for field `min_spacing_s`.
constexpr char Latitude[] = "wx_lat"; // Weather module persisted key for field `latitude`.
constexpr char Longitude[] = "wx_lon"; // Weather module persisted key for field `longitude`.
constexpr char Elevation[] = "wx_elev"; // Weather module persisted key for field `elevation_m`.
}  // namespace Weather

namespace Irrigation {
constexpr char Enabled[] = "ir_en"; // Irrigation module persisted key for field `enabled`.
constexpr char ZoneCount[] = "ir_zcnt"; // Irrigation module persisted key for field `zone_count`.
}  // namespace Irrigation

namespace Zone {
/** @brief printf format for per-zone name key (example `zn0nm`). */
constexpr char NameFmt[] = "zn%unm"; // Zone key template; `%u` is replaced by zone index before NVS access.
/** @brief printf format for per-zone sprinkler precipitation rate (mm/h) key. */
constexpr char RateFmt[] = "zn%urt"; // Zone key template; `%u` is replaced by zone index before NVS access.
/** @brief printf format for per-zone crop coefficient key. */
constexpr char KcFmt[] = "zn%ukc"; // Zone key template; `%u` is replaced by zone index before NVS access.
/** @brief printf format for per-zone minimum runtime (s) key. */
constexpr char MinRuntimeFmt[] = "zn%umin"; // Zone key template; `%u` is replaced by zone index before NVS access.
/** @brief printf format for per-zone maximum runtime (s) key. */
constexpr char MaxRuntimeFmt[] = "zn%umax"; // Zone key template; `%u` is replaced by zone index before NVS access.
/** @brief printf format for per-zone minimum interval between runs (s) key. */
constexpr char MinIntervalFmt[] = "zn%uivl"; // Zone key template; `%u` is replaced by zone index before NVS access.
/** @brief printf format for per-zone ledger blob key (example `zn0lg`). */
constexpr char LedgerFmt[] = "zn%ulg"; // Zone ledger runtime key template; `%u` is replaced by zone index before NVS access.
}  // namespace Zone

namespace Valve {
/** @brief printf format for per-valve GPIO pin key (example `vl0pin`). */
constexpr char PinFmt[] = "vl%upin"; // Valve key template; `%u` is replaced by zone index before NVS access.
/** @brief printf format for per-valve active-high flag key. */
constexpr char ActiveHighFmt[] = "vl%uah"; // Valve key template; `%u` is replaced by zone index before NVS access.
/** @brief printf format for per-valve safety cutoff (s) key. */
constexpr char MaxOnFmt[] = "vl%umaxs"; // Valve key template; `%u` is replaced by zone index before NVS access.
}  // namespace Valve

}  // namespace NvsKeys
