#include <fuelhud/fuel_curve.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <system_error>
#include <vector>
#include <spdlog/spdlog.h>

namespace fuelhud {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

// Non-numeric text reads as NaN so validation drops the row.
static double to_double(const std::string& s) {
  constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
  if (s.empty()) return kNaN;
  try {
    std::size_t idx = 0;
    const double v = std::stod(s, &idx);
    return idx == s.size() ? v : kNaN;
  } catch (const std::exception&) {
    // invalid_argument or out_of_range
    return kNaN;
  }
}

std::optional<DeltaCurve> parse_curve_stream(std::istream& in) {
  DeltaCurve out;
  std::string line;
  while (std::getline(in, line)) {
    const std::string raw = trim(line);
    if (raw.empty()) continue;

    const auto cols = split_csv_line(raw);
    if (cols.size() != 3) return std::nullopt;

    out.push_back(FuelSample{to_double(cols[0]), to_double(cols[1]), to_double(cols[2])});
  }
  return out;
}

DeltaCurve validate_curve(const DeltaCurve& curve) {
  DeltaCurve out;
  out.reserve(curve.size());
  for (const auto& s : curve) {
    if (!std::isfinite(s.distance) || !std::isfinite(s.fuel_used) || !std::isfinite(s.lap_time))
      continue;
    if (!out.empty() && s.distance < out.back().distance) continue;
    out.push_back(s);
  }
  return out;
}

bool write_curve_stream(std::ostream& out, const DeltaCurve& curve) {
  out << std::fixed << std::setprecision(6);
  for (const auto& s : curve) {
    out << round6(s.distance) << ','
        << round6(s.fuel_used) << ','
        << round6(s.lap_time) << '\n';
  }
  return static_cast<bool>(out);
}

FuelCurveStore::FuelCurveStore(std::filesystem::path dir, std::string extension)
  : dir_(std::move(dir)), ext_(std::move(extension)) {}

std::filesystem::path FuelCurveStore::path_for(const std::string& combo) const {
  return dir_ / (combo + ext_);
}

CurveLoad FuelCurveStore::load(const std::string& combo) const {
  CurveLoad res{};
  const auto path = path_for(combo);

  std::ifstream f(path);
  if (!f) {
    spdlog::info("MISSING: fuel data ({})", combo);
    return res;
  }

  auto parsed = parse_curve_stream(f);
  if (!parsed) {
    spdlog::info("MISSING: fuel data, malformed file {}", path.string());
    return res;
  }

  DeltaCurve cleaned = validate_curve(*parsed);
  if (cleaned.empty()) {
    spdlog::info("MISSING: fuel data, no valid rows in {}", path.string());
    return res;
  }

  res.used_last = cleaned.back().fuel_used;
  res.laptime_last = cleaned.back().lap_time;
  res.status = CurveStatus::Loaded;

  if (cleaned.size() != parsed->size()) {
    spdlog::warn("fuel data {}: dropped {} invalid rows", combo, parsed->size() - cleaned.size());
    f.close();
    save(combo, cleaned);
    res.status = CurveStatus::Repaired;
  }
  res.curve = std::move(cleaned);
  return res;
}

bool FuelCurveStore::save(const std::string& combo, const DeltaCurve& curve) const {
  if (curve.size() < kMinSavedSamples) return false;

  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    spdlog::warn("fuel data: cannot create {}: {}", dir_.string(), ec.message());
    return false;
  }

  const auto target = path_for(combo);
  auto tmp = target;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    bool written = out && write_curve_stream(out, curve);
    if (written) {
      // Buffered rows reach the disk here
      out.close();
      written = !out.fail();
    }
    if (!written) {
      spdlog::warn("fuel data: write failed {}, keeping previous file", tmp.string());
      std::filesystem::remove(tmp, ec);
      return false;
    }
  }

  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    spdlog::warn("fuel data: cannot replace {}: {}", target.string(), ec.message());
    std::filesystem::remove(tmp, ec);
    return false;
  }
  spdlog::info("SAVED: fuel data {} ({} samples)", combo, curve.size());
  return true;
}

} // namespace fuelhud
