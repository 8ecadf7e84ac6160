#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/api/deal_filter.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/patch/deal_patch.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

using pipeline::factory::RuntimeDependencies;
using pipeline::model::Deal;

static void Usage() {
  std::cout << "Usage:\n"
            << "  pipeline-manager --config <file.yaml> list\n"
            << "  pipeline-manager --config <file.yaml> show <deal_id>\n"
            << "  pipeline-manager --config <file.yaml> query <key=value>...\n"
            << "  pipeline-manager --config <file.yaml> patch <deal_id> <Field=Value>...   (Field=null clears)\n"
            << "  pipeline-manager --config <file.yaml> delete <deal_id>\n"
            << "  pipeline-manager --config <file.yaml> validate\n"
            << "  pipeline-manager --config <file.yaml> backups\n"
            << "  pipeline-manager --config <file.yaml> restore\n"
            << "  pipeline-manager --config <file.yaml> export <path> <version>\n"
            << "\n"
            << "query keys: search stage owner region product min_amount max_amount close_from close_to\n"
            << "            due_before overdue no_contact_days tags promoter promo_code has_promoter ref\n";
}

static std::string OrDash(const std::string& value) {
  return value.empty() ? "-" : value;
}

static std::string FormatAmount(const std::optional<double>& amount) {
  return amount ? pipeline::util::FormatDecimal(*amount) : "-";
}

static std::string FormatOptionalDate(const std::optional<pipeline::util::Date>& date) {
  return date ? pipeline::util::FormatDate(*date) : "-";
}

static void PrintSummary(const Deal& deal) {
  std::cout << deal.deal_id << "  " << OrDash(deal.account_name) << "  " << OrDash(deal.deal_name) << "  "
            << pipeline::model::StageName(deal.stage) << "  " << deal.probability << "%  " << FormatAmount(deal.amount_gbp) << "  "
            << OrDash(deal.owner) << "\n";
}

static void PrintDetail(const Deal& deal) {
  std::cout << "DealId:             " << deal.deal_id << "\n"
            << "AccountName:        " << OrDash(deal.account_name) << "\n"
            << "ContactName:        " << OrDash(deal.contact_name) << "\n"
            << "Email:              " << OrDash(deal.email) << "\n"
            << "Phone:              " << OrDash(deal.phone) << "\n"
            << "Postcode:           " << OrDash(deal.postcode) << "\n"
            << "PostcodeArea:       " << OrDash(deal.postcode_area) << "\n"
            << "Region:             " << OrDash(deal.region) << "\n"
            << "MapLink:            " << OrDash(deal.map_link) << "\n"
            << "DealName:           " << OrDash(deal.deal_name) << "\n"
            << "Stage:              " << pipeline::model::StageName(deal.stage) << "\n"
            << "Probability:        " << deal.probability << "\n"
            << "AmountGBP:          " << FormatAmount(deal.amount_gbp) << "\n"
            << "WeightedAmountGBP:  " << FormatAmount(deal.WeightedAmountGbp()) << "\n"
            << "Owner:              " << OrDash(deal.owner) << "\n"
            << "CreatedDate:        " << FormatOptionalDate(deal.created_date) << "\n"
            << "LastContactedDate:  " << FormatOptionalDate(deal.last_contacted_date) << "\n"
            << "NextStep:           " << OrDash(deal.next_step) << "\n"
            << "NextStepDueDate:    " << FormatOptionalDate(deal.next_step_due_date) << "\n"
            << "CloseDate:          " << FormatOptionalDate(deal.close_date) << "\n"
            << "Tags:               " << OrDash(pipeline::model::FormatTagList(deal.tags)) << "\n"
            << "PromoterId:         " << OrDash(deal.promoter_id) << "\n"
            << "PromoCode:          " << OrDash(deal.promo_code) << "\n"
            << "CommissionPaid:     " << (deal.commission_paid ? "Yes" : "No") << "\n";
  for (const auto& [column, value] : deal.extra_columns) {
    std::cout << column << ": " << value << "\n";
  }
}

static bool SplitAssignment(const std::string& arg, std::string* key, std::string* value) {
  auto eq = arg.find('=');
  if (eq == std::string::npos || eq == 0) {
    std::cerr << "expected key=value, got '" << arg << "'\n";
    return false;
  }
  *key   = arg.substr(0, eq);
  *value = arg.substr(eq + 1);
  return true;
}

static std::optional<pipeline::util::Date> RequireDate(const std::string& key, const std::string& value) {
  auto date = pipeline::util::ParseDate(value);
  if (!date) std::cerr << "invalid date for " << key << ": " << value << "\n";
  return date;
}

// Returns nullopt after printing the problem.
static std::optional<pipeline::db::DealFilter> BuildFilter(const std::vector<std::string>& args, pipeline::util::Date* reference_date) {
  pipeline::db::DealFilter filter;

  for (const auto& arg : args) {
    std::string key;
    std::string value;
    if (!SplitAssignment(arg, &key, &value)) return std::nullopt;

    if (key == "search") {
      filter.search_text = value;
    } else if (key == "stage") {
      for (const auto& name : pipeline::util::Split(value, ",")) {
        auto stage = pipeline::model::TryParseStage(name);
        if (!stage) {
          std::cerr << "unknown stage: " << name << "\n";
          return std::nullopt;
        }
        filter.stages.push_back(*stage);
      }
    } else if (key == "owner") {
      filter.owner = value;
    } else if (key == "region") {
      filter.region = value;
    } else if (key == "product") {
      filter.product_line = value;
    } else if (key == "min_amount" || key == "max_amount") {
      auto amount = pipeline::model::ParseAmount(value);
      if (!amount) {
        std::cerr << "invalid amount for " << key << ": " << value << "\n";
        return std::nullopt;
      }
      (key == "min_amount" ? filter.min_amount : filter.max_amount) = amount;
    } else if (key == "close_from" || key == "close_to" || key == "due_before" || key == "ref") {
      auto date = RequireDate(key, value);
      if (!date) return std::nullopt;
      if (key == "close_from") filter.close_date_from = date;
      if (key == "close_to") filter.close_date_to = date;
      if (key == "due_before") filter.next_step_due_before = date;
      if (key == "ref") *reference_date = *date;
    } else if (key == "overdue" || key == "has_promoter") {
      auto flag = pipeline::model::ParseFlag(value);
      if (!flag) {
        std::cerr << "invalid flag for " << key << ": " << value << "\n";
        return std::nullopt;
      }
      if (key == "overdue") filter.has_overdue_next_step = *flag;
      if (key == "has_promoter") filter.has_promoter = flag;
    } else if (key == "no_contact_days") {
      auto days = pipeline::util::ParseInt(value);
      if (!days || *days < 0) {
        std::cerr << "invalid day count: " << value << "\n";
        return std::nullopt;
      }
      filter.no_contact_days = days;
    } else if (key == "tags") {
      filter.tags = pipeline::model::ParseTagList(value);
    } else if (key == "promoter") {
      filter.promoter_id = value;
    } else if (key == "promo_code") {
      filter.promo_code = value;
    } else {
      std::cerr << "unknown query key: " << key << "\n";
      return std::nullopt;
    }
  }
  return filter;
}

static int RequireWorkbook(const RuntimeDependencies& deps, const std::string& cmd) {
  if (!deps.workbook_store) {
    std::cerr << cmd << " requires store.workbook in the configuration\n";
    return 1;
  }
  return 0;
}

static int Run(const RuntimeDependencies& deps, const std::string& cmd, const std::vector<std::string>& args) {
  auto& service = *deps.pipeline_service;

  // ------------------------------------------------------------

  if (cmd == "list") {
    auto deals = service.ListDeals();
    for (const auto& deal : deals) PrintSummary(deal);
    std::cout << deals.size() << " deal(s)\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "show") {
    if (args.size() != 1) {
      Usage();
      return 1;
    }
    auto deal = service.GetDeal(args[0]);
    if (!deal) {
      std::cerr << "Deal not found: " << args[0] << "\n";
      return 1;
    }
    PrintDetail(*deal);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "query") {
    auto reference_date = deps.context->Today();
    auto filter         = BuildFilter(args, &reference_date);
    if (!filter) return 1;

    auto deals = service.ListDeals(*filter, reference_date);
    for (const auto& deal : deals) PrintSummary(deal);
    std::cout << deals.size() << " deal(s)\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "patch") {
    if (args.size() < 2) {
      Usage();
      return 1;
    }

    pipeline::patch::PatchRequest request;
    for (std::size_t i = 1; i < args.size(); ++i) {
      std::string key;
      std::string value;
      if (!SplitAssignment(args[i], &key, &value)) return 1;
      if (value == "null") {
        request.emplace_back(key, std::nullopt);
      } else {
        request.emplace_back(key, value);
      }
    }

    auto result = service.PatchDeal(args[0], request);

    for (const auto& applied : result.applied_fields) {
      std::cout << "applied  " << applied.field << ": '" << applied.old_value << "' -> '" << applied.new_value << "'\n";
    }
    for (const auto& rejected : result.rejected_fields) {
      std::cout << "rejected " << rejected.field << " = '" << rejected.attempted_value << "': " << rejected.reason << "\n";
    }
    for (const auto& change : result.normalization_changes) {
      std::cout << "normalized " << change.field << ": " << change.reason << "\n";
    }
    if (!result.error.empty()) std::cerr << result.error << "\n";

    return result.success ? 0 : 1;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (args.size() != 1) {
      Usage();
      return 1;
    }
    if (!service.DeleteDeal(args[0])) {
      std::cerr << "Deal not found: " << args[0] << "\n";
      return 1;
    }
    std::cout << "deleted " << args[0] << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "validate") {
    if (int rc = RequireWorkbook(deps, cmd)) return rc;

    auto result = deps.workbook_store->Validate();
    std::cout << "valid:    " << (result.valid ? "yes" : "no") << "\n"
              << "version:  " << OrDash(result.detected_version) << (result.version_supported ? "" : " (unsupported)") << "\n"
              << "deals:    " << result.deal_count << "\n";
    for (const auto& error : result.errors) std::cout << "error:    " << error << "\n";
    for (const auto& warning : result.warnings) std::cout << "warning:  " << warning << "\n";
    return result.valid && result.version_supported ? 0 : 1;
  }

  // ------------------------------------------------------------

  if (cmd == "backups") {
    if (int rc = RequireWorkbook(deps, cmd)) return rc;

    for (const auto& backup : deps.workbook_store->GetBackups()) {
      std::cout << backup.timestamp << "  " << backup.path.string() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "restore") {
    if (int rc = RequireWorkbook(deps, cmd)) return rc;

    if (!deps.workbook_store->RestoreFromBackup()) {
      std::cerr << "no valid backup to restore\n";
      return 1;
    }
    std::cout << "restored " << deps.workbook_store->FilePath().string() << " (" << deps.workbook_store->GetAll().size()
              << " deals)\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "export") {
    if (int rc = RequireWorkbook(deps, cmd)) return rc;
    if (args.size() != 2) {
      Usage();
      return 1;
    }

    deps.workbook_store->ExportAs(args[0], args[1]);
    std::cout << "exported " << args[0] << " as " << args[1] << "\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[2];
  const std::string        cmd         = argv[3];
  std::vector<std::string> args(argv + 4, argv + argc);

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = pipeline::config::ConfigLoader::LoadFromYaml(config_path);

    pipeline::observability::InitializeLogging(config.logging());

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto deps = pipeline::factory::BuildRuntime(config);

    int rc = Run(deps, cmd, args);

    pipeline::observability::ShutdownLogging();
    return rc;
  } catch (const pipeline::util::InvalidState& e) {
    std::cerr << e.what() << "\n";
    pipeline::observability::ShutdownLogging();
    return 1;
  } catch (const std::exception& e) {
    PIPELINE_LOG_ERROR("Fatal error", {pipeline::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    pipeline::observability::ShutdownLogging();
    return 2;
  }
}
