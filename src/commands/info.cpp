#include "commands/info.hpp"

#include "pwf/Models.hpp"

#include <iostream>

int cmd_info() {
    static const pwf::Modality modalities[] = {
        pwf::Modality::Strength, pwf::Modality::Countdown, pwf::Modality::Stopwatch, pwf::Modality::Interval,
        pwf::Modality::Cycling,  pwf::Modality::Running,   pwf::Modality::Rowing,    pwf::Modality::Swimming,
    };

    std::cout << "PWF - Portable Workout Format\n\n";
    std::cout << "Format version: 1.0\n\n";
    std::cout << "Supported formats:\n";
    std::cout << "  " << pwf::document_kind_str(pwf::DocumentKind::Plan) << " - Workout plan templates\n";
    std::cout << "  " << pwf::document_kind_str(pwf::DocumentKind::History) << " - Workout history exports\n\n";
    std::cout << "Modalities:\n";
    for (pwf::Modality m : modalities) {
        std::cout << "  " << pwf::modality_str(m) << "\n";
    }
    return 0;
}
