#include "ccv.h"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <yaml-cpp/yaml.h>

namespace {

YAML::Node result_to_yaml(const ccv_result &result)
{
    YAML::Node output;
    output["valid"] = result.valid;
    output["major industry"] = result.major_industry;
    if (result.issuer != nullptr) {
        output["card issuer"] = result.issuer;
    } else {
        output["card issuer"] = YAML::Null;
    }
    output["card number"] = result.card_number;
    output["personal digits"] = result.personal_digits;
    output["check digit"] = std::string(1, result.check_digit);
    return output;
}

void print(const ccv_result &result)
{
    YAML::Emitter out(std::cout);
    out.SetIndent(2);
    out.SetMapFormat(YAML::Block);
    out << result_to_yaml(result);
    std::cout << "\n\n";
}

} // namespace

int main()
{
    ccv_config config{{7, 19}, 0};
    ccv_handle handle = ccv_init(&config);
    if (handle == nullptr) {
        return EXIT_FAILURE;
    }

    ccv_result result;
    for (const char *number : {"4111 1111 1111 1111", "5427-6257-9341-0839"}) {
        if (ccv_validate(handle, number, strlen(number), &result) == CCV_OK) {
            print(result);
        }
    }

    for (const char *identifier : {"4", "37", "30", "6011"}) {
        if (ccv_generate(handle, identifier, strlen(identifier), &result) == CCV_OK) {
            print(result);
        }
    }

    ccv_destroy(handle);

    return EXIT_SUCCESS;
}
