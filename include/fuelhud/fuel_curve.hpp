#pragma once
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <fuelhud/fuel_sample.hpp>

namespace fuelhud {

// Stream-level helpers (test-friendly; no filesystem required).

// Rows of exactly three numbers "distance,fuel_used,lap_time", no header.
// Blank lines are skipped. Non-numeric fields read as NaN.
// Returns nullopt if any row does not have exactly three fields.
std::optional<DeltaCurve> parse_curve_stream(std::istream& in);

// Drops rows with non-finite values or a distance lower than the previous kept row.
DeltaCurve validate_curve(const DeltaCurve& curve);

// Writes every sample rounded to 6 decimals.
bool write_curve_stream(std::ostream& out, const DeltaCurve& curve);

inline constexpr std::size_t kMinSavedSamples = 10;

enum class CurveStatus {
  Loaded,    // file read as-is
  Repaired,  // invalid rows dropped, cleaned curve written back
  Defaulted  // missing or unusable file, default curve returned
};

struct CurveLoad {
  DeltaCurve curve = default_delta_curve();
  double used_last = 0.0;     // fuel used over the stored lap
  double laptime_last = 0.0;  // stored lap duration
  CurveStatus status = CurveStatus::Defaulted;
};

// One delta fuel curve file per combo under a directory.
class FuelCurveStore {
public:
  explicit FuelCurveStore(std::filesystem::path dir, std::string extension = ".fuel");

  CurveLoad load(const std::string& combo) const;

  // No-op below kMinSavedSamples. Replaces the file via temp-then-rename.
  bool save(const std::string& combo, const DeltaCurve& curve) const;

  std::filesystem::path path_for(const std::string& combo) const;

private:
  std::filesystem::path dir_;
  std::string ext_;
};

} // namespace fuelhud
