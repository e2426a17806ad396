#include "routes.hpp"
#include "utils.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <signal.h>

// A viewer hanging up mid-stream must not kill the process
struct SigPipeIgnore {
    SigPipeIgnore() { signal(SIGPIPE, SIG_IGN); }
} g_sigpipe_ignore;

// --- HTML page ---
static std::string page_home() {
    return R"(<!doctype html>
<html>
<head>
<meta name="viewport" content="width=device-width,initial-scale=1">
<title>CamLight</title>
<style>
body { font-family: Arial, sans-serif; margin:0; background:#0d1117; color:#c9d1d9; }
.nav { padding:12px; background:#161b22; display:flex; gap:16px; align-items:center; }
.grid { display:grid; gap:16px; padding:16px; max-width:1000px; margin:auto; }
img { max-width:100%; border-radius:8px; box-shadow:0 0 8px rgba(0,0,0,0.5); }
button { background:#238636; color:#fff; padding:8px 12px; border:none; border-radius:4px; cursor:pointer; }
.bar { display:flex; flex-wrap:wrap; gap:8px; }
</style>
<script>
function post(url, body) {
  return fetch(url, {method:'POST', headers:{'Content-Type':'application/x-www-form-urlencoded'}, body:body||''});
}
function led(r,g,b) { post('/set_led', 'red='+r+'&green='+g+'&blue='+b); }
function toggleAuto() {
  post('/toggle_motion_led').then(r=>r.json()).then(j=>{
    document.getElementById('auto').textContent = j.motion_led_auto ? 'Auto LED: on' : 'Auto LED: off';
  });
}
function capture() {
  post('/capture').then(r=>r.blob()).then(b=>{
    const a=document.createElement('a'); a.href=URL.createObjectURL(b); a.download='capture.jpg'; a.click();
  });
}
setInterval(()=>{
  fetch('/motion_status').then(r=>r.json()).then(j=>{
    document.getElementById('motion').textContent = j.motion ? 'Motion detected' : 'No motion';
  });
}, 1000);
</script>
</head>
<body>
<div class="nav"><b>CamLight</b><span id="motion">...</span></div>
<div class="grid">
<img src="/video_feed"/>
<div class="bar">
<button onclick="capture()">Capture Image</button>
<button onclick="led(100,0,0)">Red</button>
<button onclick="led(0,100,0)">Green</button>
<button onclick="led(0,0,100)">Blue</button>
<button onclick="led(50,0,50)">Violet</button>
<button onclick="led(100,100,0)">Yellow</button>
<button onclick="led(100,100,100)">White</button>
<button onclick="post('/off_led')">Off</button>
<button id="auto" onclick="toggleAuto()">Toggle Auto LED</button>
</div>
</div>
</body>
</html>)";
}

// --- helpers ---
int form_percent(const std::unordered_map<std::string,std::string>& form, const std::string& name) {
    auto it = form.find(name);
    if (it == form.end() || it->second.empty()) return 0;
    char* end = nullptr;
    double v = strtod(it->second.c_str(), &end);
    if (end == it->second.c_str() || !std::isfinite(v)) return 0;
    if (v < 0) v = 0;
    if (v > 100) v = 100;
    return (int)std::lround(v);
}

static const char* json_bool(bool b) { return b ? "true" : "false"; }

static void json_reply(HttpResponse& res, const std::string& body, int status = 200) {
    res.status = status;
    res.headers["Content-Type"] = "application/json";
    res.body = body;
}

static std::string device_json(const DeviceState& st) {
    Rgb c = st.command.output();
    char buf[256];
    snprintf(buf, sizeof(buf),
             "{\"command\":\"%s\",\"color\":\"%s\",\"red\":%d,\"green\":%d,\"blue\":%d,\"auto_mode\":%s}",
             st.command.kind == DeviceCommand::Kind::Off ? "off" : "color",
             color_name(c).c_str(), c.red, c.green, c.blue, json_bool(st.auto_mode));
    return buf;
}

// --- register routes ---
void register_routes(HttpServer& srv, CamPipeline& cam) {
    srv.add_route("GET","/",[&](const HttpRequest&, HttpResponse& res){
        res.headers["Content-Type"]="text/html";
        res.body = page_home();
    });

    srv.add_route("GET","/video_feed",[&](const HttpRequest&, HttpResponse& res){
        res.headers["Cache-Control"]="no-cache";
        res.headers["Pragma"]="no-cache";
        res.headers["Content-Type"]=std::string("multipart/x-mixed-replace; boundary=") + StreamMultiplexer::BOUNDARY;
        res.stream = [&cam](ResponseStream& out){
            auto session = cam.open_stream();
            StreamUnit unit;
            while (out.ok() && cam.loop_state() == AcquisitionLoop::State::Running) {
                if (!session->next(unit)) continue;   // nothing new yet
                out.write(unit.bytes.data(), unit.bytes.size());
            }
        };
    });

    srv.add_route("GET","/preview.jpg",[&](const HttpRequest&, HttpResponse& res){
        std::vector<unsigned char> jpeg; std::string err;
        if (!cam.live_preview_frame(jpeg, err)) { res.status=503; res.body=err; return; }
        res.headers["Content-Type"]="image/jpeg";
        res.headers["Cache-Control"]="no-cache";
        res.body.assign(jpeg.begin(), jpeg.end());
    });

    srv.add_route("POST","/capture",[&](const HttpRequest&, HttpResponse& res){
        std::vector<unsigned char> jpeg; std::string err;
        if (!cam.capture_snapshot(jpeg, err)) { res.status=503; res.body=err; return; }
        res.headers["Content-Type"]="image/jpeg";
        res.headers["Content-Disposition"]="attachment; filename=\"capture_" + now_timestamp_filename() + ".jpg\"";
        res.body.assign(jpeg.begin(), jpeg.end());
    });

    srv.add_route("GET","/motion_status",[&](const HttpRequest&, HttpResponse& res){
        json_reply(res, std::string("{\"motion\":") + json_bool(cam.motion_status().detected) + "}");
    });

    srv.add_route("POST","/set_led",[&](const HttpRequest& req, HttpResponse& res){
        auto form = parse_form(req.body.empty() ? req.query : req.body);
        DeviceState st = cam.set_device_color(form_percent(form,"red"),
                                              form_percent(form,"green"),
                                              form_percent(form,"blue"));
        json_reply(res, "{\"success\":true,\"device\":" + device_json(st) + "}");
    });

    srv.add_route("POST","/off_led",[&](const HttpRequest&, HttpResponse& res){
        DeviceState st = cam.turn_device_off();
        json_reply(res, "{\"success\":true,\"device\":" + device_json(st) + "}");
    });

    srv.add_route("POST","/toggle_motion_led",[&](const HttpRequest&, HttpResponse& res){
        json_reply(res, std::string("{\"motion_led_auto\":") + json_bool(cam.toggle_auto_mode()) + "}");
    });

    srv.add_route("GET","/status",[&](const HttpRequest&, HttpResponse& res){
        MotionState m = cam.motion_status();
        char buf[160];
        snprintf(buf, sizeof(buf), "\"loop\":\"%s\",\"viewers\":%d,\"connections\":%d,\"motion\":%s,\"sequence\":%llu",
                 AcquisitionLoop::state_name(cam.loop_state()), cam.viewers(), srv.connections(),
                 json_bool(m.detected), (unsigned long long)m.sequence);
        json_reply(res, std::string("{") + buf + ",\"device\":" + device_json(cam.device_state()) + "}");
    });
}
