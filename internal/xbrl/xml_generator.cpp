#include "xml_generator.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/package/package_naming.hpp"

namespace roipack::xbrl {

using model::TemplateId;
using observability::IntField;
using observability::StringField;

namespace {

constexpr std::string_view kXbrlNamespace     = "http://www.xbrl.org/2003/instance";
constexpr std::string_view kLinkNamespace     = "http://www.xbrl.org/2003/linkbase";
constexpr std::string_view kIso4217Namespace  = "http://www.xbrl.org/2003/iso4217";
constexpr std::string_view kEbaNamespace      = "http://www.eba.europa.eu/xbrl/crr/dict";
constexpr std::string_view kDoraTaxonomy      = "http://www.eba.europa.eu/eu/fr/xbrl/crr/fws/dora/4.0";
constexpr std::string_view kLeiScheme         = "http://standards.iso.org/iso/17442";

constexpr std::string_view kRequiredNamespaces[] = {"xbrli", "link", "eba_met"};

/*
  Line-oriented output with optional indentation. Compact mode drops both
  the indentation and the line breaks.
*/
class XmlWriter {
 public:
  explicit XmlWriter(bool pretty) : pretty_(pretty) {}

  void Line(int depth, std::string_view text) {
    if (pretty_) {
      out_.append(static_cast<std::size_t>(depth) * 2, ' ');
    }
    out_ += text;
    if (pretty_) {
      out_.push_back('\n');
    }
  }

  void Blank() {
    if (pretty_) {
      out_.push_back('\n');
    }
  }

  std::string Take() { return std::move(out_); }

 private:
  bool        pretty_;
  std::string out_;
};

std::string CurrencyCode(std::string_view base_currency) {
  if (base_currency.rfind(parameters::kCurrencyPrefix, 0) == 0) {
    base_currency.remove_prefix(parameters::kCurrencyPrefix.size());
  }
  std::string code(base_currency);
  for (auto& c : code) {
    if (c >= 'a' && c <= 'z') {
      c = static_cast<char>(c - 'a' + 'A');
    }
  }
  return code;
}

std::string ContextId(TemplateId id, std::size_t row_index) {
  std::string safe(model::ToString(id));
  for (auto& c : safe) {
    if (c == '.') {
      c = '_';
    }
  }
  return "ctx_" + safe + "_r" + std::to_string(row_index);
}

// Fixed notation with max(0, decimals) fraction digits. Empty for non-finite values.
std::string FormatXmlNumber(double value, int decimals) {
  if (!std::isfinite(value)) {
    return {};
  }
  const int digits = decimals > 0 ? decimals : 0;
  const int needed = std::snprintf(nullptr, 0, "%.*f", digits, value);
  std::string out(static_cast<std::size_t>(needed) + 1, '\0');
  std::snprintf(out.data(), out.size(), "%.*f", digits, value);
  out.resize(static_cast<std::size_t>(needed));
  if (out == "-0") {
    return "0";
  }
  return out;
}

// The formatted element, or empty when the cell yields no fact.
std::string FactElement(const std::string& column, const model::Value& value, const std::string& context_id, const std::string& unit_id,
                        const parameters::PackageParameters& params) {
  std::string attributes = "contextRef=\"" + context_id + "\"";

  const auto text = std::visit(
      [&](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return {};
        } else if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
          if (IsMonetaryColumn(column)) {
            attributes += " unitRef=\"" + unit_id + "\" decimals=\"" + std::to_string(params.decimals_monetary) + "\"";
            return FormatXmlNumber(v, params.decimals_monetary);
          }
          return FormatXmlNumber(v, params.decimals_integer);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return EscapeXml(v);
        } else {
          return util::ToCalendarDate(v);
        }
      },
      value);

  if (text.empty()) {
    return {};
  }

  const std::string concept_name = "eba_met:mi" + column;
  return "<" + concept_name + " " + attributes + ">" + text + "</" + concept_name + ">";
}

std::string TaxonomyPackageXml(util::TimePoint timestamp) {
  std::string xml;
  xml += "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  xml += "<tp:taxonomyPackage\n";
  xml += "  xmlns:tp=\"http://xbrl.org/2016/taxonomy-package\"\n";
  xml += "  xml:lang=\"en\">\n";
  xml += "  <tp:identifier>" + std::string(kDoraTaxonomy) + "</tp:identifier>\n";
  xml += "  <tp:name>DORA Register of Information</tp:name>\n";
  xml += "  <tp:description>EBA DORA Regulatory Framework - Register of Information</tp:description>\n";
  xml += "  <tp:version>4.0</tp:version>\n";
  xml += "  <tp:publisher>European Banking Authority</tp:publisher>\n";
  xml += "  <tp:publisherURL>https://www.eba.europa.eu</tp:publisherURL>\n";
  xml += "  <tp:publisherCountry>EU</tp:publisherCountry>\n";
  xml += "  <tp:publicationDate>" + util::ToCalendarDate(timestamp) + "</tp:publicationDate>\n";
  xml += "  <tp:entryPoints>\n";
  xml += "    <tp:entryPoint>\n";
  xml += "      <tp:name>DORA RoI Entry Point</tp:name>\n";
  xml += "      <tp:entryPointDocument href=\"mod/dora.xsd\"/>\n";
  xml += "    </tp:entryPoint>\n";
  xml += "  </tp:entryPoints>\n";
  xml += "</tp:taxonomyPackage>";
  return xml;
}

} // namespace

std::string_view TemplateConcept(TemplateId id) {
  switch (id) {
    case TemplateId::kB0101:
      return "eba_tRT0101";
    case TemplateId::kB0102:
      return "eba_tRT0102";
    case TemplateId::kB0103:
      return "eba_tRT0103";
    case TemplateId::kB0201:
      return "eba_tRT0201";
    case TemplateId::kB0202:
      return "eba_tRT0202";
    case TemplateId::kB0203:
      return "eba_tRT0203";
    case TemplateId::kB0301:
      return "eba_tRT0301";
    case TemplateId::kB0302:
      return "eba_tRT0302";
    case TemplateId::kB0303:
      return "eba_tRT0303";
    case TemplateId::kB0401:
      return "eba_tRT0401";
    case TemplateId::kB0501:
      return "eba_tRT0501";
    case TemplateId::kB0502:
      return "eba_tRT0502";
    case TemplateId::kB0601:
      return "eba_tRT0601";
    case TemplateId::kB0701:
      return "eba_tRT0701";
    case TemplateId::kB9901:
    default:
      return "eba_tRT9901";
  }
}

std::string EscapeXml(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&apos;";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

bool IsMonetaryColumn(std::string_view column) {
  return column == "c0050" || column == "c0100" || column == "c0110";
}

std::string InstanceFileName(const parameters::PackageParameters& params, util::TimePoint timestamp) {
  return parameters::LegalIdFromEntityId(params.entity_id) + "_DORA_" + params.ref_period + "_" + package::TimestampToken(timestamp) + ".xml";
}

XbrlInstance GenerateXbrlInstance(const parameters::PackageParameters& params, const model::TemplateDataset& dataset,
                                  const registry::TemplateRegistry& registry, util::TimePoint timestamp, const XmlOptions& options) {
  XbrlInstance instance;

  const auto legal_id = parameters::LegalIdFromEntityId(params.entity_id);
  const auto currency = CurrencyCode(params.base_currency);
  const auto unit_id  = "unit_" + currency;

  XmlWriter contexts(options.pretty_print);
  XmlWriter facts(options.pretty_print);

  for (const auto id : model::kAllTemplates) {
    const auto it = dataset.find(id);
    if (it == dataset.end() || it->second.empty()) {
      continue;
    }
    ++instance.template_count;

    const auto& columns = registry.ColumnOrder(id);
    for (std::size_t r = 0; r < it->second.size(); ++r) {
      const auto& row        = it->second[r];
      const auto  context_id = ContextId(id, r);

      contexts.Line(1, "<xbrli:context id=\"" + context_id + "\">");
      contexts.Line(2, "<xbrli:entity>");
      contexts.Line(3, "<xbrli:identifier scheme=\"" + std::string(kLeiScheme) + "\">" + EscapeXml(legal_id) + "</xbrli:identifier>");
      contexts.Line(2, "</xbrli:entity>");
      contexts.Line(2, "<xbrli:period>");
      contexts.Line(3, "<xbrli:instant>" + params.ref_period + "</xbrli:instant>");
      contexts.Line(2, "</xbrli:period>");
      contexts.Line(2, "<xbrli:scenario>");
      contexts.Line(3, "<xbrldi:explicitMember dimension=\"eba_dim:BAS\">" + std::string(TemplateConcept(id)) + "</xbrldi:explicitMember>");
      contexts.Line(2, "</xbrli:scenario>");
      contexts.Line(1, "</xbrli:context>");

      for (const auto& column : columns) {
        const auto cell = row.find(column);
        if (cell == row.end()) {
          continue;
        }
        auto fact = FactElement(column, cell->second, context_id, unit_id, params);
        if (!fact.empty()) {
          facts.Line(1, fact);
          ++instance.fact_count;
        }
      }
    }
  }

  XmlWriter doc(options.pretty_print);
  doc.Line(0, "<?xml version=\"1.0\" encoding=\"UTF-8\"?>");
  const std::string namespaces[] = {
      "xmlns:xbrli=\"" + std::string(kXbrlNamespace) + "\"",
      "xmlns:link=\"" + std::string(kLinkNamespace) + "\"",
      "xmlns:xlink=\"http://www.w3.org/1999/xlink\"",
      "xmlns:iso4217=\"" + std::string(kIso4217Namespace) + "\"",
      "xmlns:xbrldi=\"http://xbrl.org/2006/xbrldi\"",
      "xmlns:eba_met=\"" + std::string(kEbaNamespace) + "/met\"",
      "xmlns:eba_dim=\"" + std::string(kEbaNamespace) + "/dim\"",
      "xmlns:eba_typ=\"" + std::string(kEbaNamespace) + "/typ\"",
  };
  std::string root = "<xbrli:xbrl";
  for (const auto& ns : namespaces) {
    root += options.pretty_print ? "\n  " : " ";
    root += ns;
  }
  root += ">";
  doc.Line(0, root);
  doc.Blank();
  doc.Line(1, "<!-- DORA Register of Information - XBRL Instance -->");
  doc.Line(1, "<!-- Generated on " + util::ToIso8601(timestamp) + " -->");
  doc.Line(1, "<!-- Entity: " + EscapeXml(legal_id) + " -->");
  doc.Line(1, "<!-- Period: " + params.ref_period + " -->");
  doc.Blank();
  doc.Line(1, "<link:schemaRef xlink:type=\"simple\" xlink:href=\"" + std::string(kDoraTaxonomy) + "/mod/dora.xsd\"/>");
  doc.Blank();
  doc.Line(1, "<xbrli:unit id=\"" + unit_id + "\">");
  doc.Line(2, "<xbrli:measure>iso4217:" + currency + "</xbrli:measure>");
  doc.Line(1, "</xbrli:unit>");
  doc.Line(1, "<xbrli:unit id=\"unit_pure\">");
  doc.Line(2, "<xbrli:measure>xbrli:pure</xbrli:measure>");
  doc.Line(1, "</xbrli:unit>");
  doc.Blank();

  instance.xml = doc.Take();
  instance.xml += contexts.Take();
  if (options.pretty_print) {
    instance.xml.push_back('\n');
  }
  instance.xml += facts.Take();
  if (options.pretty_print) {
    instance.xml.push_back('\n');
  }
  instance.xml += "</xbrli:xbrl>";

  instance.file_name = InstanceFileName(params, timestamp);

  ROIPACK_LOG_INFO("XBRL instance generated", {StringField("file", instance.file_name), IntField("templates", static_cast<std::int64_t>(instance.template_count)),
                                               IntField("facts", static_cast<std::int64_t>(instance.fact_count))});
  return instance;
}

XbrlPackage GenerateXbrlPackage(const parameters::PackageParameters& params, const model::TemplateDataset& dataset,
                                const registry::TemplateRegistry& registry, util::TimePoint timestamp, const XmlOptions& options) {
  auto instance = GenerateXbrlInstance(params, dataset, registry, timestamp, options);

  XbrlPackage result;
  result.instance_xml         = std::move(instance.xml);
  result.taxonomy_package_xml = TaxonomyPackageXml(timestamp);
  result.file_name            = std::move(instance.file_name);
  result.legal_id             = parameters::LegalIdFromEntityId(params.entity_id);
  result.reporting_period     = params.ref_period;
  result.generated_at         = util::ToIso8601(timestamp);
  result.template_count       = instance.template_count;
  result.fact_count           = instance.fact_count;
  return result;
}

StructureReport ValidateXbrlStructure(std::string_view xml) {
  StructureReport report;

  auto contains = [&](std::string_view needle) { return xml.find(needle) != std::string_view::npos; };

  if (xml.rfind("<?xml", 0) != 0) {
    report.errors.emplace_back("Missing XML declaration");
  }
  if (!contains("<xbrli:xbrl")) {
    report.errors.emplace_back("Missing xbrli:xbrl root element");
  }
  for (const auto ns : kRequiredNamespaces) {
    if (!contains("xmlns:" + std::string(ns))) {
      report.errors.push_back("Missing required namespace: " + std::string(ns));
    }
  }
  if (!contains("schemaRef")) {
    report.warnings.emplace_back("Missing schema reference (link:schemaRef)");
  }
  if (!contains("<xbrli:context")) {
    report.warnings.emplace_back("No contexts found - document may be empty");
  }
  if (!contains("</xbrli:xbrl>")) {
    report.errors.emplace_back("Missing closing xbrli:xbrl tag");
  }

  report.valid = report.errors.empty();
  return report;
}

} // namespace roipack::xbrl
