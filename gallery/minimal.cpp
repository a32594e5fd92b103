#include "anchormap/anchormap.hpp"
#include "tatami_mtx/tatami_mtx.hpp"
#include <iostream>
#include <fstream>
#include <unordered_map>

int main(int argc, char * argv[]) {
    if (argc < 4) {
        std::cerr << "COMMAND [reference.mtx] [reference_labels.txt] [query.mtx]" << std::endl;
        return 1;
    }

    // Loading log-normalized values from unzipped MatrixMarket files. Both
    // files should contain the same features in the same order.
    std::shared_ptr<const tatami::NumericMatrix> ref_mat = tatami_mtx::load_matrix_from_file<false, double, int>(argv[1]);
    std::shared_ptr<const tatami::NumericMatrix> query_mat = tatami_mtx::load_matrix_from_file<false, double, int>(argv[3]);

    auto make_names = [](const std::string& prefix, size_t n) -> std::vector<std::string> {
        std::vector<std::string> output;
        output.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            output.push_back(prefix + std::to_string(i));
        }
        return output;
    };
    anchormap::Dataset reference(ref_mat, make_names("gene", ref_mat->nrow()), make_names("ref", ref_mat->ncol()));
    anchormap::Dataset query(query_mat, make_names("gene", query_mat->nrow()), make_names("query", query_mat->ncol()));

    // One label per line for each reference cell.
    std::vector<std::string> labels;
    {
        std::ifstream handle(argv[2]);
        std::string line;
        while (std::getline(handle, line)) {
            labels.push_back(line);
        }
    }

    try {
        auto anchors = anchormap::FindTransferAnchors().set_num_threads(4).run(reference, query);
        auto transferred = anchormap::TransferData().set_num_threads(4).run(anchors, { { "labels", std::move(labels) } });

        const auto& field = transferred.labels.front();
        std::unordered_map<std::string, int> counters;
        int unassigned = 0;
        for (size_t q = 0; q < query.num_cells(); ++q) {
            auto p = field.predicted(q);
            if (p.empty()) {
                ++unassigned;
            } else {
                ++(counters[p]);
            }
        }

        std::cout << "Mapped " << query.num_cells() << " cells in '" << argv[3] << "' with " << anchors.anchors().size() << " anchors\n";
        for (const auto& l : field.levels) {
            std::cout << "  " << l << ": " << counters[l] << "\n";
        }
        std::cout << "  (unassigned): " << unassigned << std::endl;

    } catch (anchormap::Error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    return 0;
}
