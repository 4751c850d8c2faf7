#include <iostream>
#include <memory>

#include "src/config/config.hpp"
#include "src/http/client/curl_easy.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/utils/json_utils.hpp"
#include "src/utils/logging.hpp"
#include "src/volley/controller/run_controller.hpp"

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "volley";

    try {
        const config::RunConfig cfg = config::parse_args(argc, argv);

        if (cfg.show_help_) {
            std::cout << config::usage(program);
            return 0;
        }

        config::validate(cfg);
        logging::init(cfg.verbose_);
        config::print(cfg, std::cout);

        http::client::CurlGlobal curl_global;

        const http::client::CurlOptions curl_options{.connect_timeout_ms_ = cfg.connect_timeout_ms_, .timeout_ms_ = cfg.timeout_ms_};

        auto controller = volley::RunControllerBuilder()
                              .with_config(cfg)
                              .with_http_client_factory([curl_options]() { return std::make_unique<http::client::CurlEasy>(curl_options); })
                              .with_output(std::cout)
                              .validate()
                              .build();

        controller->run();
    } catch (const config::ConfigError& e) {
        std::cerr << "error: " << e.what() << "\n" << config::usage(program);
        return 2;
    } catch (const json_utils::SerializationError& e) {
        std::cerr << "error: failed to render report: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
};
