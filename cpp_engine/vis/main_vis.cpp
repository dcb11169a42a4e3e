// main_vis.cpp
// - KPI dashboard over a sweep's simulation_results.csv (EV share, CO2, grid cost, revenue vs toll)
// - Live adoption curve with parameter sliders, tornado bars and low/high perturbation curves
// - CSV is re-read on demand ("Reload"), so a running sweep can be watched as it finishes

#include "imgui.h"
// ---- Docking compatibility shim (older ImGui builds do not define docking flags/APIs)
#ifndef ImGuiConfigFlags_DockingEnable
#define EVTOLL_NO_IMGUI_DOCKING 1
#endif
#include "implot.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

// Platform GL headers: on Windows, <GL/gl.h> requires Windows types/macros (APIENTRY/WINGDIAPI).
// Include <windows.h> first to avoid syntax errors in the Windows SDK gl.h.
#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#endif

#include <GLFW/glfw3.h>

#ifdef __APPLE__
#  include <OpenGL/gl.h>
#else
#  include <GL/gl.h>
#endif

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include "AdoptionModel.h"
#include "KpiReport.h"
#include "SensitivityAnalysis.h"

static void glfw_error_callback(int error, const char* description) {
    std::fprintf(stderr, "GLFW Error %d: %s\n", error, description ? description : "(null)");
}

static int fail(const char* msg) {
    std::fprintf(stderr, "FATAL: %s\n", msg ? msg : "(null)");
    std::fprintf(stderr, "\n");
    return EXIT_FAILURE;
}

// Column views of the KPI table, rebuilt on every reload.
struct KpiSeries {
    std::vector<double> toll, ev_share_pct, co2_kg, energy_kwh, grid_cost, revenue;
    std::string status;

    void load(const std::string& path) {
        std::vector<evtoll::KpiResult> rows;
        const bool ok = evtoll::importKpiCsv(path, rows);
        toll.clear(); ev_share_pct.clear(); co2_kg.clear();
        energy_kwh.clear(); grid_cost.clear(); revenue.clear();
        for (const auto& r : rows) {
            toll.push_back(r.toll_eur);
            ev_share_pct.push_back(r.ev_share * 100.0);
            co2_kg.push_back(r.total_co2_kg);
            energy_kwh.push_back(r.total_energy_kwh);
            grid_cost.push_back(r.grid_cost_eur);
            revenue.push_back(r.toll_revenue_eur);
        }
        char buf[256];
        std::snprintf(buf, sizeof(buf), "%s: %d row(s)%s", path.c_str(), (int)rows.size(),
                      ok ? "" : " (read error)");
        status = buf;
    }
};

static void plot_series_with_xlimits(const char* title,
                                     const char* label,
                                     const std::vector<double>& xs,
                                     const std::vector<double>& ys,
                                     double x0,
                                     double x1)
{
    if (xs.empty() || xs.size() != ys.size())
        return;

    if (ImPlot::BeginPlot(title)) {

        // --- X-axis handling (robust across ImPlot versions) ---
#if defined(ImAxis_X1)
        // ImPlot >= 0.16
        ImPlot::SetupAxisLimits(ImAxis_X1, x0, x1, ImGuiCond_Always);
#elif defined(ImPlotAxis_X1)
        // Transitional versions
        ImPlot::SetupAxisLimits(ImPlotAxis_X1, x0, x1, ImGuiCond_Always);
#else
        // Very old ImPlot: auto-fit
        (void)x0;
        (void)x1;
#endif

        ImPlot::PlotLine(label, xs.data(), ys.data(), (int)xs.size());
        ImPlot::PlotScatter(label, xs.data(), ys.data(), (int)xs.size());

        ImPlot::EndPlot();
    }
}

int main(int argc, char** argv) {
    std::string csv_path = "simulation_results.csv";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i] ? argv[i] : "";
        if (arg == "--csv" && i + 1 < argc) {
            csv_path = argv[++i];
        }
    }

    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) return fail("glfwInit failed");

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

    GLFWwindow* window = glfwCreateWindow(1280, 720, "EV Toll Dashboard", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return fail("glfwCreateWindow failed");
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

    const GLubyte* gl_version = glGetString(GL_VERSION);
    if (!gl_version) {
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("OpenGL context validation failed (glGetString(GL_VERSION) returned null)");
    }
    std::fprintf(stderr, "OpenGL Version:  %s\n", gl_version);

    bool imgui_ctx = false;
    bool implot_ctx = false;
    bool imgui_glfw = false;
    bool imgui_gl3 = false;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    imgui_ctx = true;

    ImGuiIO& io = ImGui::GetIO();
#ifndef EVTOLL_NO_IMGUI_DOCKING
    io.ConfigFlags |= ImGuiConfigFlags_DockingEnable;
#else
    (void)io;
#endif

    ImPlot::CreateContext();
    implot_ctx = true;

    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForOpenGL(window, true)) {
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplGlfw_InitForOpenGL failed");
    }
    imgui_glfw = true;

    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplOpenGL3_Init failed");
    }
    imgui_gl3 = true;

    KpiSeries kpi;
    kpi.load(csv_path);

    // --- Adoption model under inspection (sliders) ---
    float baseline = 0.15f;
    float max_share = 0.90f;
    float midpoint = 2.5f;
    float steepness = 0.5f;
    float reference_toll = 0.0f;
    float relative_step = 0.20f;

    evtoll::SensitivityAnalyzer analyzer;
    std::vector<double> curve_toll, curve_share;
    std::vector<evtoll::SensitivityAnalyzer::TornadoEntry> tornado;
    std::vector<evtoll::SensitivityAnalyzer::SensitivityRecord> perturbed;
    std::string model_status;
    bool model_dirty = true;

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        if (model_dirty) {
            evtoll::SensitivityAnalyzer::Config cfg = analyzer.config();
            cfg.reference.params.baseline_share = baseline;
            cfg.reference.params.max_share = max_share;
            cfg.reference.params.midpoint_eur = midpoint;
            cfg.reference.params.steepness = steepness;
            cfg.reference_toll_eur = reference_toll;
            cfg.relative_step = relative_step;
            analyzer.setConfig(cfg);

            curve_toll.clear();
            curve_share.clear();
            tornado.clear();
            perturbed.clear();
            const evtoll::ParameterCheck check = analyzer.validate();
            if (check.ok) {
                for (int i = 0; i <= 100; ++i) {
                    const double t = 0.05 * i;
                    curve_toll.push_back(t);
                    curve_share.push_back(cfg.reference.share(t) * 100.0);
                }
                tornado = analyzer.tornado();
                perturbed = analyzer.perturbationCurves();
                model_status = "ok";
            } else {
                model_status = check.message;
            }
            model_dirty = false;
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

#ifndef EVTOLL_NO_IMGUI_DOCKING
        ImGui::DockSpaceOverViewport(ImGui::GetMainViewport());
#endif

        // ---------------- KPI results ----------------
        if (ImGui::Begin("Sweep Results")) {
            ImGui::TextUnformatted(kpi.status.c_str());
            if (ImGui::Button("Reload")) {
                kpi.load(csv_path);
            }

            double x0 = 0.0, x1 = 1.0;
            if (!kpi.toll.empty()) {
                x0 = *std::min_element(kpi.toll.begin(), kpi.toll.end()) - 0.25;
                x1 = *std::max_element(kpi.toll.begin(), kpi.toll.end()) + 0.25;
            }
            plot_series_with_xlimits("EV share (%)", "ev_share", kpi.toll, kpi.ev_share_pct, x0, x1);
            plot_series_with_xlimits("Total CO2 (kg)", "co2", kpi.toll, kpi.co2_kg, x0, x1);
            plot_series_with_xlimits("Toll revenue (EUR)", "revenue", kpi.toll, kpi.revenue, x0, x1);
            plot_series_with_xlimits("Grid cost (EUR)", "grid_cost", kpi.toll, kpi.grid_cost, x0, x1);
        }
        ImGui::End();

        // ---------------- Adoption model ----------------
        if (ImGui::Begin("Adoption Model")) {
            model_dirty |= ImGui::SliderFloat("Baseline share", &baseline, 0.0f, 1.0f, "%.3f");
            model_dirty |= ImGui::SliderFloat("Max share", &max_share, 0.0f, 1.0f, "%.3f");
            model_dirty |= ImGui::SliderFloat("Midpoint (EUR)", &midpoint, 0.0f, 5.0f, "%.2f");
            model_dirty |= ImGui::SliderFloat("Steepness (1/EUR)", &steepness, 0.05f, 3.0f, "%.2f");
            model_dirty |= ImGui::SliderFloat("Reference toll (EUR)", &reference_toll, 0.0f, 5.0f, "%.1f");
            model_dirty |= ImGui::SliderFloat("Relative step", &relative_step, 0.05f, 0.5f, "%.2f");
            ImGui::Text("Model: %s", model_status.c_str());

            if (!curve_toll.empty()) {
                evtoll::AdoptionParameters p;
                p.baseline_share = baseline;
                p.max_share = max_share;
                p.midpoint_eur = midpoint;
                p.steepness = steepness;
                ImGui::Text("Transition slope at midpoint: %.2f %%/EUR",
                            evtoll::transitionSlopeAtMidpoint(p) * 100.0);
                plot_series_with_xlimits("Adoption curve (%)", "ev_share", curve_toll, curve_share, 0.0, 5.0);
            }
        }
        ImGui::End();

        // ---------------- Sensitivity ----------------
        if (ImGui::Begin("Sensitivity")) {
            for (const auto& e : tornado) {
                ImGui::Text("%-15s impact %6.2f %%  (low %.3f -> %+.2f %%, high %.3f -> %+.2f %%)",
                            evtoll::parameterName(e.parameter), e.impact * 100.0,
                            e.low_value, e.low_delta * 100.0, e.high_value, e.high_delta * 100.0);
            }

            if (!tornado.empty() && ImPlot::BeginPlot("Tornado (impact, % points)")) {
                for (std::size_t i = 0; i < tornado.size(); ++i) {
                    const double x = (double)i;
                    const double h = tornado[i].impact * 100.0;
                    ImPlot::PlotBars(evtoll::parameterName(tornado[i].parameter), &x, &h, 1, 0.6);
                }
                ImPlot::EndPlot();
            }

            if (!perturbed.empty() && ImPlot::BeginPlot("Perturbed adoption curves (%)")) {
                std::vector<double> xs, ys;
                std::string label;
                for (std::size_t i = 0; i < perturbed.size(); ++i) {
                    const auto& r = perturbed[i];
                    xs.push_back(r.toll_eur);
                    ys.push_back(r.ev_share * 100.0);
                    const bool last = (i + 1 == perturbed.size()) ||
                                      perturbed[i + 1].parameter != r.parameter ||
                                      perturbed[i + 1].high_side != r.high_side;
                    if (last) {
                        label = std::string(evtoll::parameterName(r.parameter)) + (r.high_side ? " high" : " low");
                        ImPlot::PlotLine(label.c_str(), xs.data(), ys.data(), (int)xs.size());
                        xs.clear();
                        ys.clear();
                    }
                }
                ImPlot::EndPlot();
            }
        }
        ImGui::End();

        ImGui::Render();

        int fb_w = 0, fb_h = 0;
        glfwGetFramebufferSize(window, &fb_w, &fb_h);
        if (fb_w > 0 && fb_h > 0) {
            glViewport(0, 0, fb_w, fb_h);
            glClearColor(0.06f, 0.06f, 0.07f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        }

        glfwSwapBuffers(window);
    }

    // Cleanup
    if (implot_ctx) ImPlot::DestroyContext();
    if (imgui_gl3) ImGui_ImplOpenGL3_Shutdown();
    if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
    if (imgui_ctx) ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
