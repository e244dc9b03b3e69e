/**
 * This file is a part of qtermdoc Project.
 * qtermdoc renders document pages inside a terminal
 * Copyright 2021-2022 Britanicus <marcusbritanicus@gmail.com>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * at your option, any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 **/

#include <qtermdoc/QTermDocument.hpp>

#include <QFileSystemWatcher>

/*
 * Generic class to handle document
 */

QTermDocument::QTermDocument( QString path ) : QObject() {
    mStatus     = Null;
    mError      = NoError;
    mPassNeeded = false;
    mGeneration = 0;
    fsw         = nullptr;

    mDocPath = QFileInfo( path ).absoluteFilePath();
}


QTermDocument::~QTermDocument() {
    qDeleteAll( mPages );
    mPages.clear();

    delete fsw;
}


QString QTermDocument::documentPath() const {
    return mDocPath;
}


bool QTermDocument::passwordNeeded() const {
    return mPassNeeded;
}


int QTermDocument::pageCount() const {
    return mPages.count();
}


QSizeF QTermDocument::pageSize( int pageNo ) const {
    if ( (pageNo < 0) or (pageNo >= mPages.count() ) ) {
        return QSizeF();
    }

    return mPages.at( pageNo )->pageSize();
}


void QTermDocument::setWatchFile( bool yes ) {
    if ( not yes ) {
        delete fsw;
        fsw = nullptr;
        return;
    }

    if ( fsw ) {
        return;
    }

    fsw = new QFileSystemWatcher();
    fsw->addPath( mDocPath );

    connect(
        fsw, &QFileSystemWatcher::fileChanged, [ = ]( QString file ) {
            /* File deleted and created again: add it to the watcher */
            if ( not fsw->files().contains( file ) and QFile::exists( file ) ) {
                fsw->addPath( file );
            }

            reload();
        }
    );
}


void QTermDocument::reload() {
    emit documentReloading();

    close();

    mStatus = Null;
    load();

    if ( mStatus == Ready ) {
        qDebug() << "Reloaded" << mDocPath << "generation" << mGeneration;
        emit documentReloaded();
    }
}


QTermDocument::Status QTermDocument::status() const {
    return mStatus;
}


QTermDocument::Error QTermDocument::error() const {
    return mError;
}


quint64 QTermDocument::generation() const {
    return mGeneration;
}


void QTermDocument::bumpGeneration() {
    mGeneration++;
}


QImage QTermDocument::renderPage( int pageNo, QSize size, QTermRenderOptions opts ) const {
    if ( (pageNo < 0) or (pageNo >= mPages.count() ) ) {
        qWarning() << "Page out of range:" << pageNo << "of" << mPages.count();
        return QImage();
    }

    if ( size.width() <= 0 or size.height() <= 0 ) {
        return QImage();
    }

    if ( size.width() > QTERMDOC_MAX_RENDER_EDGE or size.height() > QTERMDOC_MAX_RENDER_EDGE ) {
        qWarning() << "Render size too large:" << size;
        return QImage();
    }

    QImage img = mPages.at( pageNo )->render( size, opts );

    if ( img.isNull() ) {
        qWarning() << "Rasterization failed for page" << pageNo;
        return QImage();
    }

    /** The backend may round the resolution: we promise the exact size */
    if ( img.size() != size ) {
        img = img.scaled( size, Qt::IgnoreAspectRatio, Qt::SmoothTransformation );
    }

    if ( opts.colorMode() == QTermRenderOptions::Grayscale ) {
        img = img.convertToFormat( QImage::Format_Grayscale8 );
    }

    return img.convertToFormat( QImage::Format_RGBA8888 );
}


QTermTextOps QTermDocument::pageTextOps( int pageNo ) const {
    if ( (pageNo < 0) or (pageNo >= mPages.count() ) ) {
        return QTermTextOps();
    }

    return mPages.at( pageNo )->textOps();
}


/*
 * Generic class to handle a document page
 */

QTermPage::QTermPage( int pgNo ) {
    mPageNo = pgNo;
}


QTermPage::~QTermPage() {
}


int QTermPage::pageNo() {
    return mPageNo;
}
