#include "app/DocForgeApp.hpp"

int main(int argc, char** argv) {
    docforge::app::DocForgeApp app;
    return app.Run(argc, argv);
}
