#include "storage/detail/xml_document.hpp"

#include "boost/property_tree/ptree.hpp"
#include "boost/property_tree/xml_parser.hpp"
#include <sstream>

namespace s3drop {
	namespace storage {
		namespace detail {
			namespace {
				api::optional<boost::property_tree::ptree> read_document(const std::string& body){
					if (body.empty())
						return api::nullopt;
					auto in = std::istringstream{body};
					auto doc = boost::property_tree::ptree{};
					try{
						boost::property_tree::read_xml(in, doc, boost::property_tree::xml_parser::trim_whitespace);
					}
					catch (const boost::property_tree::xml_parser_error&){
						return api::nullopt;
					}
					return doc;
				}
			}

			api::optional<upload_id> parse_upload_id(const std::string& body){
				auto doc = read_document(body);
				if (not doc)
					return api::nullopt;
				auto id = doc->get_optional<std::string>("InitiateMultipartUploadResult.UploadId");
				if (not id or id->empty())
					return api::nullopt;
				return *id;
			}

			api::optional<error_document> parse_error_document(const std::string& body){
				auto doc = read_document(body);
				if (not doc)
					return api::nullopt;
				auto error_node = doc->get_child_optional("Error");
				if (not error_node)
					return api::nullopt;
				auto result = error_document{};
				result.code = error_node->get<std::string>("Code", "");
				result.message = error_node->get<std::string>("Message", "");
				return result;
			}

			std::string make_complete_multipart_body(const std::vector<completed_part>& parts){
				auto doc = boost::property_tree::ptree{};
				auto& root = doc.add_child("CompleteMultipartUpload", boost::property_tree::ptree{});
				for (auto& part : parts){
					auto part_node = boost::property_tree::ptree{};
					part_node.put("PartNumber", part.part_number);
					part_node.put("ETag", part.tag);
					root.add_child("Part", part_node);
				}
				auto out = std::ostringstream{};
				boost::property_tree::write_xml(out, doc);
				return out.str();
			}
		}
	}
}
