#include "lookup_tables.hpp"

#include <utility>
#include <vector>

#include "internal/util/strings.hpp"

namespace pipeline::model {

LookupTables LookupTables::CreateDefault() {
  static const std::vector<std::pair<std::string, std::vector<std::string>>> kRegions = {
      {"London", {"E", "EC", "N", "NW", "SE", "SW", "W", "WC"}},
      {"South East", {"BN", "CT", "GU", "ME", "OX", "PO", "RG", "RH", "SL", "SO", "TN"}},
      {"South West", {"BA", "BH", "BS", "DT", "EX", "GL", "PL", "SN", "SP", "TA", "TQ", "TR"}},
      {"East of England", {"AL", "CB", "CM", "CO", "EN", "HP", "IP", "LU", "NR", "PE", "SG", "SS", "WD"}},
      {"West Midlands", {"B", "CV", "DY", "HR", "ST", "TF", "WR", "WS", "WV"}},
      {"East Midlands", {"DE", "DN", "LE", "LN", "NG", "NN"}},
      {"Yorkshire", {"BD", "HD", "HG", "HU", "HX", "LS", "S", "WF", "YO"}},
      {"North West", {"BB", "BL", "CA", "CH", "CW", "FY", "L", "LA", "M", "OL", "PR", "SK", "WA", "WN"}},
      {"North East", {"DH", "DL", "NE", "SR", "TS"}},
      {"Wales", {"CF", "LD", "LL", "NP", "SA", "SY"}},
      {"Scotland", {"AB", "DD", "DG", "EH", "FK", "G", "HS", "IV", "KA", "KW", "KY", "ML", "PA", "PH", "TD", "ZE"}},
      {"Northern Ireland", {"BT"}},
  };

  LookupTables tables;
  for (const auto& [region, areas] : kRegions) {
    for (const auto& area : areas) {
      tables.SetRegion(area, region);
    }
  }
  for (auto stage : AllStages()) {
    tables.SetStageProbability(stage, DefaultProbability(stage));
  }
  return tables;
}

void LookupTables::SetRegion(std::string_view area, std::string region) {
  area_to_region_[util::ToUpper(util::Trim(area))] = std::move(region);
}

void LookupTables::SetStageProbability(DealStage stage, int probability) {
  stage_probability_[stage] = probability;
}

std::optional<std::string> LookupTables::RegionForArea(std::string_view area) const {
  auto it = area_to_region_.find(util::ToUpper(util::Trim(area)));
  if (it == area_to_region_.end()) return std::nullopt;
  return it->second;
}

std::optional<std::string> LookupTables::RegionForPostcode(std::string_view postcode) const {
  if (util::IsBlank(postcode)) return std::nullopt;
  return RegionForArea(ExtractPostcodeArea(postcode));
}

int LookupTables::ProbabilityForStage(DealStage stage) const {
  auto it = stage_probability_.find(stage);
  return it != stage_probability_.end() ? it->second : DefaultProbability(stage);
}

std::string LookupTables::ExtractPostcodeArea(std::string_view postcode) {
  const auto  clean = util::RemoveAll(util::ToUpper(util::Trim(postcode)), {" "});
  std::string area;
  for (char c : clean) {
    if (c < 'A' || c > 'Z') break;
    area.push_back(c);
  }
  return area;
}

} // namespace pipeline::model
