#include "stripe_listener_service.hpp"

int main(int argc, char** argv) {
    int exit_code = 0;
    {
        listener_app::StripeListenerService service;

        if (!service.initialize(argc, argv)) {
            logging::cleanup_logging();
            return 1;
        }

        exit_code = service.run();
    }

    logging::cleanup_logging();
    return exit_code;
}
