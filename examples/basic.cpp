#include <pdsl/pdsl.h>

#include <iostream>

using namespace pdsl;

int main(int argc, char** argv) {
    const char* text =
        "PDS_VERSION_ID = PDS3\r\n"
        "^IMAGE         = 12\r\n"
        "OBJECT         = IMAGE\r\n"
        "  LINES        = 1024\r\n"
        "  LINE_SAMPLES = 1024\r\n"
        "  SCALE        = 0.25 <KM>\r\n"
        "END_OBJECT     = IMAGE\r\n"
        "END\r\n";

    // parse, and report the error in the non-throwing form
    std::optional<odl::ParseError> error;
    auto label = odl::parse(text, error);
    if (!label) {
        std::cerr << error->what() << std::endl;
        return 1;
    }

    // read values
    auto& image = label->get("image").as<Object>().statements();
    std::cout << "lines=" << image.value("lines").to_int() << std::endl;
    std::cout << fmt::format("scale={}", image.value("scale")) << std::endl;

    // modify, and render
    image.set("lines", 512);
    label->set("product_id", Text{"EXAMPLE_001"});
    std::cout << serialize(*label);
}
