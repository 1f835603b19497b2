#include "adapters/s3/ListBucketResultXml.hpp"

#include <sstream>
#include <string>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include "domain/Errors.hpp"

namespace adapters::s3 {

namespace pt = boost::property_tree;

domain::ListObjectsPage parseListBucketResult(const std::string& xml) {
    pt::ptree tree;
    try {
        std::istringstream input(xml);
        pt::read_xml(input, tree, pt::xml_parser::trim_whitespace);
    } catch (const pt::xml_parser_error& ex) {
        throw domain::ListingError(std::string{"Malformed ListBucketResult XML: "} + ex.what());
    }

    const auto root = tree.get_child_optional("ListBucketResult");
    if (!root) {
        throw domain::ListingError("Listing response is not a ListBucketResult document");
    }

    domain::ListObjectsPage page;
    try {
        page.bucket = root->get<std::string>("Name", "");
        page.truncated = root->get<std::string>("IsTruncated", "false") == "true";
        page.nextContinuationToken = root->get<std::string>("NextContinuationToken", "");

        for (const auto& [name, child] : *root) {
            if (name == "Contents") {
                domain::ObjectSummary summary;
                summary.key = child.get<std::string>("Key");
                summary.size = child.get<std::uint64_t>("Size", 0);
                page.objects.push_back(std::move(summary));
            } else if (name == "CommonPrefixes") {
                page.commonPrefixes.push_back(child.get<std::string>("Prefix"));
            }
        }
    } catch (const pt::ptree_error& ex) {
        throw domain::ListingError(std::string{"Unexpected ListBucketResult content: "} + ex.what());
    }

    if (page.truncated && page.nextContinuationToken.empty()) {
        throw domain::ListingError("Truncated listing without NextContinuationToken");
    }
    return page;
}

}  // namespace adapters::s3
