#include <boost/program_options.hpp>
#include <estate/common/critical.hpp>
#include <estate/schema/deposit_message.hpp>
#include <estate/schema/encoding/scale/encoder.hpp>

#include <iostream>
#include <string>

namespace {

using encoder_t = estate::schema::encoding::scale_encoder_t;
namespace po = boost::program_options;

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  estate_deposit_message --property-id <id> --action "
               "purchase|lease --token <account>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto property_id = uint64_t{};
  auto action = std::string{};
  auto token = std::string{};

  auto options = po::options_description{"estate_deposit_message options"};
  options.add_options()("help,h", "show help")(
      "property-id", po::value<uint64_t>(&property_id), "listed property id")(
      "action", po::value<std::string>(&action)->default_value("purchase"),
      "purchase|lease")("token", po::value<std::string>(&token),
                        "token account the deposit arrives on");
  auto vm = po::variables_map{};
  po::store(po::parse_command_line(argc, argv, options), vm);
  po::notify(vm);

  if (vm.contains("help") || !vm.contains("property-id")) {
    print_help(options);
    return 0;
  }
  if (token.empty()) {
    estate::common::critical("--token is required");
  }
  auto parsed = estate::schema::try_from_string<estate::schema::bid_action_t>(
      action);
  if (!parsed) {
    estate::common::critical("--action must be purchase or lease");
  }

  auto message = estate::schema::deposit_message_t{
      .property_id = property_id, .action = *parsed, .token_account = token};
  auto encoded = encoder_t{}.encode(message);
  std::cout << estate::schema::to_hex(estate::schema::make_bytes_view(encoded))
            << '\n';
  return 0;
}
