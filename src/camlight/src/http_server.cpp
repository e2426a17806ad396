#include "http_server.hpp"
#include "utils.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <utility>

HttpServer::HttpServer(const HttpServerConfig& config) : config_(config) {}

bool HttpServer::start(){
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) { perror("socket"); return false; }
    int opt=1; setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    sockaddr_in addr{}; addr.sin_family=AF_INET; addr.sin_addr.s_addr=INADDR_ANY; addr.sin_port=htons(config_.port);
    if (bind(server_fd_, (sockaddr*)&addr, sizeof(addr))<0){ perror("bind"); close(server_fd_); server_fd_=-1; return false; }
    if (listen(server_fd_, config_.backlog)<0){ perror("listen"); close(server_fd_); server_fd_=-1; return false; }
    socklen_t len = sizeof(addr);
    if (getsockname(server_fd_, (sockaddr*)&addr, &len)==0) bound_port_ = ntohs(addr.sin_port);
    else bound_port_ = config_.port;
    run_ = true;
    th_ = std::thread(&HttpServer::loop, this);
    log_info("HTTP server listening on port %d", bound_port_);
    return true;
}

void HttpServer::stop(){
    run_ = false;
    if (server_fd_>=0){ shutdown(server_fd_, SHUT_RDWR); close(server_fd_); server_fd_=-1; }
    if (th_.joinable()) th_.join();

    // Detached connection threads must be gone before routes_ and the handlers' captures
    std::unique_lock<std::mutex> lk(clients_m_);
    for (int fd : clients_) shutdown(fd, SHUT_RDWR);
    if (!clients_cv_.wait_for(lk, std::chrono::seconds(cfg::HTTP_DRAIN_TIMEOUT_S),
                              [this]{ return clients_.empty(); }))
        log_warn("HTTP server: %zu connections still open after stop", clients_.size());
}

void HttpServer::add_route(const std::string& method, const std::string& path, RouteHandler h){
    routes_[path][method] = std::move(h);
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) const {
    HttpResponse res;
    auto by_path = routes_.find(req.path);
    if (by_path == routes_.end()){
        res.status = 404; res.body = "Not Found";
        return res;
    }
    auto it = by_path->second.find(req.method);
    if (it == by_path->second.end()){
        std::string allow;
        for (auto &kv: by_path->second) allow += (allow.empty() ? "" : ", ") + kv.first;
        res.status = 405; res.body = "Method Not Allowed";
        res.headers["Allow"] = allow;
        return res;
    }
    it->second(req, res);
    return res;
}

void HttpServer::loop(){
    while (run_){
        int cfd = accept(server_fd_, nullptr, nullptr);
        if (cfd<0){ if(!run_) break; if (errno!=EINTR) perror("accept"); continue; }
        // Stream viewers keep their connection thread for the whole session
        {
            std::lock_guard<std::mutex> lk(clients_m_);
            if (!run_){ close(cfd); break; }
            clients_.insert(cfd);
            ++connections_;
        }
        std::thread([this,cfd](){ serve_connection(cfd); }).detach();
    }
}

void HttpServer::serve_connection(int cfd){
    HttpRequest req;
    int rc = read_request(cfd, req);
    if (rc >= 0){
        HttpResponse res;
        if (rc > 0){ res.status = rc; res.body = status_text(rc); }
        else res = dispatch(req);

        std::string head = response_head(res);
        if (send_all(cfd, head.data(), head.size())){
            if (res.stream){
                ResponseStream out(cfd, &run_);
                res.stream(out);
            } else if (!res.body.empty()){
                send_all(cfd, res.body.data(), res.body.size());
            }
        }
    }

    std::lock_guard<std::mutex> lk(clients_m_);
    if (clients_.erase(cfd)) --connections_;
    close(cfd);
    clients_cv_.notify_all();
}

bool ResponseStream::write(const void* data, size_t len){
    if (ok_) ok_ = HttpServer::send_all(fd_, data, len);
    return ok_;
}

bool HttpServer::send_all(int fd, const void* data, size_t len){
    const char* p = static_cast<const char*>(data);
    while (len > 0){
        ssize_t n = send(fd, p, len, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        p += n; len -= (size_t)n;
    }
    return true;
}

std::string HttpServer::status_text(int status){
    switch (status){
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Status";
    }
}

std::string HttpServer::response_head(const HttpResponse& res){
    std::ostringstream hdr;
    hdr<<"HTTP/1.1 "<<res.status<<" "<<status_text(res.status)<<"\r\n";
    for (auto &kv: res.headers) hdr<<kv.first<<": "<<kv.second<<"\r\n";
    if (!res.stream) hdr<<"Content-Length: "<<res.body.size()<<"\r\n";
    hdr<<"Connection: close\r\n\r\n";
    return hdr.str();
}

static bool parse_request_line(const std::string& line, HttpRequest& req){
    std::istringstream iss(line);
    if(!(iss>>req.method)) return false;
    std::string target; if(!(iss>>target)) return false;
    size_t q = target.find('?');
    if (q==std::string::npos){ req.path = target; }
    else { req.path = target.substr(0,q); req.query = target.substr(q+1); }
    return true;
}

int HttpServer::read_request(int fd, HttpRequest& req) const {
    std::string data; char buf[2048];
    ssize_t n;
    size_t header_end = std::string::npos;
    while (header_end==std::string::npos){
        n=recv(fd,buf,sizeof(buf),0); if(n<=0) break; data.append(buf,n);
        header_end = data.find("\r\n\r\n");
        if (header_end==std::string::npos && data.size() > config_.max_header_bytes) return 431;
    }
    if (header_end==std::string::npos) return data.empty() ? -1 : 400;

    std::istringstream ss(data.substr(0, header_end));
    std::string line; if(!std::getline(ss,line)) return 400;
    if (line.size() && line.back()=='\r') line.pop_back();
    if(!parse_request_line(line, req)) return 400;

    while (std::getline(ss,line)){
        if (line.size() && line.back()=='\r') line.pop_back();
        size_t c=line.find(':'); if(c!=std::string::npos){
            std::string k=line.substr(0,c), v=line.substr(c+1);
            while (!v.empty() && (v.front()==' '||v.front()=='\t')) v.erase(v.begin());
            for (auto &ch: k) ch = (char)tolower((unsigned char)ch);
            req.headers[k]=v;
        }
    }

    size_t cl=0;
    auto it=req.headers.find("content-length");
    if(it!=req.headers.end()){
        try { cl = std::stoul(it->second); }
        catch (const std::exception&) { return 400; }
    }
    if (cl > config_.max_body_bytes) return 413;
    req.body = data.substr(header_end+4);
    while (req.body.size()<cl){
        n=recv(fd,buf,sizeof(buf),0); if(n<=0) return -1; req.body.append(buf,n);
    }
    if (req.body.size() > cl) req.body.resize(cl);
    return 0;
}

static std::string url_decode(const std::string& s){
    std::string out;
    for (size_t i=0;i<s.size();i++){
        if (s[i]=='+') out+=' ';
        else if (s[i]=='%' && i+2<s.size() && isxdigit((unsigned char)s[i+1]) && isxdigit((unsigned char)s[i+2])){
            out += (char)strtol(s.substr(i+1,2).c_str(), nullptr, 16);
            i+=2;
        }
        else out+=s[i];
    }
    return out;
}

std::unordered_map<std::string,std::string> parse_form(const std::string& body){
    std::unordered_map<std::string,std::string> out;
    size_t pos=0;
    while (pos<=body.size()){
        size_t amp = body.find('&', pos);
        std::string pair = body.substr(pos, amp==std::string::npos ? std::string::npos : amp-pos);
        if (!pair.empty()){
            size_t eq = pair.find('=');
            if (eq==std::string::npos) out[url_decode(pair)] = "";
            else out[url_decode(pair.substr(0,eq))] = url_decode(pair.substr(eq+1));
        }
        if (amp==std::string::npos) break;
        pos = amp+1;
    }
    return out;
}
