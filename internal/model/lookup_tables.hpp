#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/deal.hpp"

namespace pipeline::model {

/*
  LookupTables

  Static derivation tables used by normalization:
    postcode area -> region (keys held upper-case, matched case-insensitively)
    stage         -> default probability
*/
class LookupTables {
 public:
  // UK postcode areas for twelve regions plus the stage defaults.
  static LookupTables CreateDefault();

  void SetRegion(std::string_view area, std::string region);
  void SetStageProbability(DealStage stage, int probability);

  std::optional<std::string> RegionForArea(std::string_view area) const;
  std::optional<std::string> RegionForPostcode(std::string_view postcode) const;

  int ProbabilityForStage(DealStage stage) const;

  const std::map<std::string, std::string>& Regions() const {
    return area_to_region_;
  }

  const std::map<DealStage, int>& StageProbabilities() const {
    return stage_probability_;
  }

  // Leading letters of the trimmed, upper-cased, space-free postcode.
  static std::string ExtractPostcodeArea(std::string_view postcode);

 private:
  std::map<std::string, std::string> area_to_region_;
  std::map<DealStage, int>           stage_probability_;
};

} // namespace pipeline::model
