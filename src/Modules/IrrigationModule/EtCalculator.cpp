/**
 * @file EtCalculator.cpp
 * @brief FAO-56 Penman-Monteith, Priestley-Taylor and Hargreaves formulas.
 */

#include "Modules/IrrigationModule/EtCalculator.h"
#include "Domain/IrrigationDefaults.h"
#include <math.h>

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kSolarConstant = 0.0820;      // MJ/m2/min
constexpr double kStefanBoltzmann = 4.903e-9;  // MJ/K4/m2/day
constexpr double kLatentHeatInv = 0.408;       // MJ/m2/day -> mm/day
constexpr double kAlbedo = 0.23;
constexpr double kPriestleyTaylorAlpha = 1.26;
constexpr double kWattToMjDay = 0.0864;
constexpr double kKmhToMs = 1.0 / 3.6;

double satVaporPressure(double tC)
{
    return 0.6108 * exp((17.27 * tC) / (tC + 237.3));
}

struct DayTerms {
    double tMean = 0.0;
    double tMin = 0.0;
    double tMax = 0.0;
    double tRange = 0.0;
    double ra = 0.0;
    double delta = 0.0;
    double gamma = 0.0;
    double es = 0.0;
    double ea = 0.0;
    double rn = 0.0;
};

void computeTemperatureTerms(const DailyWeatherAggregate& agg, DayTerms& t)
{
    t.tMean = agg.mean(WeatherKind::Temperature);
    double range = (double)agg.tempMax - (double)agg.tempMin;
    if (agg.count(WeatherKind::Temperature) < 2 || !(range > 0.0)) {
        range = IrrigationDefaults::DefaultTempRangeC;
        t.tMin = t.tMean - range / 2.0;
        t.tMax = t.tMean + range / 2.0;
    } else {
        t.tMin = agg.tempMin;
        t.tMax = agg.tempMax;
    }
    t.tRange = range;
}

void computeRadiationTerms(const DailyWeatherAggregate& agg, const EtLocation& loc, DayTerms& t)
{
    double pressure = agg.has(WeatherKind::Pressure)
        ? (double)agg.mean(WeatherKind::Pressure) / 10.0
        : etStandardPressureKpa(loc.elevationM);
    t.gamma = 0.000665 * pressure;

    double esMean = satVaporPressure(t.tMean);
    t.delta = 4098.0 * esMean / ((t.tMean + 237.3) * (t.tMean + 237.3));
    t.es = (satVaporPressure(t.tMax) + satVaporPressure(t.tMin)) / 2.0;

    double rh = agg.mean(WeatherKind::Humidity);
    t.ea = esMean * rh / 100.0;

    double rs = agg.has(WeatherKind::Solar)
        ? (double)agg.mean(WeatherKind::Solar) * kWattToMjDay
        : 0.16 * sqrt(t.tRange) * t.ra;

    double rso = (0.75 + 2e-5 * (double)loc.elevationM) * t.ra;
    double ratio = (rso > 0.0) ? rs / rso : 1.0;
    if (ratio > 1.0) ratio = 1.0;
    if (ratio < 0.0) ratio = 0.0;

    double rns = (1.0 - kAlbedo) * rs;
    double tMaxK = t.tMax + 273.16;
    double tMinK = t.tMin + 273.16;
    double rnl = kStefanBoltzmann * ((tMaxK * tMaxK * tMaxK * tMaxK) + (tMinK * tMinK * tMinK * tMinK)) / 2.0
        * (0.34 - 0.14 * sqrt(t.ea > 0.0 ? t.ea : 0.0))
        * (1.35 * ratio - 0.35);
    t.rn = rns - rnl;
}

}  // namespace

double etStandardPressureKpa(double elevationM)
{
    return 101.3 * pow((293.0 - 0.0065 * elevationM) / 293.0, 5.26);
}

double etExtraterrestrialRadiation(double latitudeDeg, uint16_t dayOfYear)
{
    double phi = latitudeDeg * kPi / 180.0;
    double j = (double)dayOfYear;
    double dr = 1.0 + 0.033 * cos(2.0 * kPi * j / 365.0);
    double decl = 0.409 * sin(2.0 * kPi * j / 365.0 - 1.39);

    double x = -tan(phi) * tan(decl);
    if (x > 1.0) x = 1.0;
    if (x < -1.0) x = -1.0;
    double ws = acos(x);

    double ra = (24.0 * 60.0 / kPi) * kSolarConstant * dr
        * (ws * sin(phi) * sin(decl) + cos(phi) * cos(decl) * sin(ws));
    return (ra > 0.0) ? ra : 0.0;
}

bool computeEt0(const DailyWeatherAggregate& agg,
                const EtLocation& location,
                EtMethod method,
                uint16_t dayOfYear,
                float& et0Out)
{
    if (!agg.valid() || method == EtMethod::None) return false;
    if (!isfinite(agg.mean(WeatherKind::Temperature))) return false;

    DayTerms t{};
    computeTemperatureTerms(agg, t);
    t.ra = etExtraterrestrialRadiation(location.latitudeDeg, dayOfYear);

    double et0 = 0.0;
    switch (method) {
        case EtMethod::Hargreaves:
            et0 = 0.0023 * (t.tMean + 17.8) * sqrt(t.tRange) * t.ra * kLatentHeatInv;
            break;

        case EtMethod::PriestleyTaylor:
            computeRadiationTerms(agg, location, t);
            et0 = kPriestleyTaylorAlpha * (t.delta / (t.delta + t.gamma)) * t.rn * kLatentHeatInv;
            break;

        case EtMethod::PenmanMonteith: {
            computeRadiationTerms(agg, location, t);
            double u2 = agg.has(WeatherKind::Wind) ? (double)agg.mean(WeatherKind::Wind) * kKmhToMs : 2.0;
            double vpd = t.es - t.ea;
            if (vpd < 0.0) vpd = 0.0;
            double num = kLatentHeatInv * t.delta * t.rn
                + t.gamma * (900.0 / (t.tMean + 273.0)) * u2 * vpd;
            double den = t.delta + t.gamma * (1.0 + 0.34 * u2);
            if (den <= 0.0) return false;
            et0 = num / den;
            break;
        }

        default:
            return false;
    }

    if (!isfinite(et0)) return false;
    if (et0 < 0.0) et0 = 0.0;
    et0Out = (float)et0;
    return true;
}

bool computeDailyEt0(const DailyWeatherAggregate& agg,
                     const EtLocation& location,
                     uint32_t dateKey,
                     EtResult& out)
{
    out = EtResult{};
    out.method = selectEtMethod(agg);
    if (out.method == EtMethod::None) return false;

    uint16_t doy = etDayOfYear(dateKey);
    if (doy == 0) return false;

    return computeEt0(agg, location, out.method, doy, out.et0Mm);
}

uint16_t etDayOfYear(uint32_t dateKey)
{
    static const uint16_t kCumDays[12] = {0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334};
    static const uint8_t kMonthDays[12] = {31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

    uint32_t year = dateKey / 10000U;
    uint32_t month = (dateKey / 100U) % 100U;
    uint32_t day = dateKey % 100U;
    if (year == 0 || month < 1 || month > 12 || day < 1 || day > kMonthDays[month - 1]) return 0;

    bool leap = ((year % 4U) == 0 && (year % 100U) != 0) || ((year % 400U) == 0);
    if (month == 2 && day == 29 && !leap) return 0;

    uint16_t doy = (uint16_t)(kCumDays[month - 1] + day);
    if (leap && month > 2) ++doy;
    return doy;
}

float clampCropCoefficient(float kc)
{
    if (!isfinite(kc)) return IrrigationDefaults::KcDefault;
    if (kc < IrrigationDefaults::KcMin) return IrrigationDefaults::KcMin;
    if (kc > IrrigationDefaults::KcMax) return IrrigationDefaults::KcMax;
    return kc;
}

float etcFromEt0(float et0Mm, float kc)
{
    return et0Mm * clampCropCoefficient(kc);
}
