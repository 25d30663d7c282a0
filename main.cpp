#include "app/TimeNotesApp.hpp"

int main(int argc, char** argv) {
    timenotes::app::TimeNotesApp app;
    return app.Run(argc, argv);
}
